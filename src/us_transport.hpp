// Datagram transports the protocol runs on
#pragma once

#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

struct PeerAddress {
    sockaddr_in addr{};
};

PeerAddress resolve_peer(const std::string& host, uint16_t port);
bool same_peer(const PeerAddress& a, const PeerAddress& b);
std::string peer_to_string(const PeerAddress& p);

struct Datagram {
    PeerAddress from;
    std::vector<uint8_t> bytes;
};

// Minimal send / receive capability used by sessions.
// send() returns false on a transient failure (caller may retry later) and
// throws TransportError when the peer can no longer be reached.
// receive_with_timeout() returns false when nothing arrived in time.
class Transport {
public:
    virtual ~Transport() = default;
    virtual bool send(const PeerAddress& to, const uint8_t* data, size_t len) = 0;
    virtual bool receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) = 0;

    bool send(const PeerAddress& to, const std::vector<uint8_t>& bytes) {
        return send(to, bytes.data(), bytes.size());
    }
};

class UdpTransport : public Transport {
public:
    // bind_port 0 picks an ephemeral port.
    explicit UdpTransport(uint16_t bind_port = 0);
    ~UdpTransport() override;
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    bool send(const PeerAddress& to, const uint8_t* data, size_t len) override;
    bool receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) override;
    using Transport::send;

    uint16_t local_port() const;

private:
    int sockfd_ = -1;
    std::vector<uint8_t> rbuf_;
};

// TCP-analog variant: every datagram travels as [length:4][bytes] on one
// connection. The listening side accepts its peer on the first receive.
class StreamTransport : public Transport {
public:
    static std::unique_ptr<StreamTransport> listen(uint16_t port);
    static std::unique_ptr<StreamTransport> connect(const PeerAddress& peer);
    ~StreamTransport() override;
    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    bool send(const PeerAddress& to, const uint8_t* data, size_t len) override;
    bool receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) override;
    using Transport::send;

    uint16_t local_port() const;

private:
    StreamTransport() = default;
    bool accept_peer(std::chrono::milliseconds timeout);
    void read_exact(uint8_t* out, size_t len);

    int listen_fd_ = -1;
    int conn_fd_ = -1;
    PeerAddress peer_{};
};

// Drops outbound datagrams with a fixed probability.
class LossyTransport : public Transport {
public:
    LossyTransport(std::unique_ptr<Transport> inner, double loss, uint32_t seed);

    bool send(const PeerAddress& to, const uint8_t* data, size_t len) override;
    bool receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) override;
    using Transport::send;

    uint64_t dropped() const { return dropped_; }

private:
    std::unique_ptr<Transport> inner_;
    double loss_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
    uint64_t dropped_ = 0;
};

enum class TransportMode { Datagram, Stream };

// Listening side (sender): binds port. Connecting side (receiver): peer set.
std::unique_ptr<Transport> make_listening_transport(TransportMode mode, uint16_t port, double loss, uint32_t seed);
std::unique_ptr<Transport> make_connecting_transport(TransportMode mode, const PeerAddress& peer, double loss, uint32_t seed);
