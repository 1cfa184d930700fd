#include "us_transport.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>

#include "us_common.hpp"

PeerAddress resolve_peer(const std::string& host, uint16_t port) {
    PeerAddress p;
    p.addr.sin_family = AF_INET;
    p.addr.sin_port = htons(port);
    if (inet_aton(host.c_str(), &p.addr.sin_addr) != 0) return p;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr) {
        throw std::invalid_argument("cannot resolve " + host + ": " + gai_strerror(rc));
    }
    p.addr.sin_addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return p;
}

bool same_peer(const PeerAddress& a, const PeerAddress& b) {
    return a.addr.sin_addr.s_addr == b.addr.sin_addr.s_addr && a.addr.sin_port == b.addr.sin_port;
}

std::string peer_to_string(const PeerAddress& p) {
    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &p.addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(p.addr.sin_port));
}

static bool transient_send_error(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == ENOBUFS || err == EINTR;
}

static uint16_t bound_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, (sockaddr*)&addr, &len) != 0) throw TransportError(errno, "getsockname");
    return ntohs(addr.sin_port);
}

// Waits for fd to become readable. false on timeout or signal.
static bool wait_readable(int fd, std::chrono::milliseconds timeout) {
    pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    int pr = ::poll(&p, 1, static_cast<int>(timeout.count()));
    if (pr < 0) {
        if (errno == EINTR) return false;
        throw TransportError(errno, "poll");
    }
    return pr > 0;
}

UdpTransport::UdpTransport(uint16_t bind_port) : rbuf_(MAX_DATAGRAM) {
    sockfd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) throw TransportError(errno, "socket");

    // Larger socket buffers absorb a full window of retransmissions
    int bufsize = 4 * 1024 * 1024;
    setsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &bufsize, sizeof(bufsize));
    setsockopt(sockfd_, SOL_SOCKET, SO_SNDBUF, &bufsize, sizeof(bufsize));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(bind_port);
    if (bind(sockfd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        ::close(sockfd_);
        throw TransportError(err, "bind");
    }
}

UdpTransport::~UdpTransport() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

uint16_t UdpTransport::local_port() const {
    return bound_port(sockfd_);
}

bool UdpTransport::send(const PeerAddress& to, const uint8_t* data, size_t len) {
    ssize_t rc = sendto(sockfd_, data, len, 0, (const sockaddr*)&to.addr, sizeof(to.addr));
    if (rc < 0) {
        if (transient_send_error(errno)) return false;
        throw TransportError(errno, "sendto " + peer_to_string(to));
    }
    return true;
}

bool UdpTransport::receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) {
    if (!wait_readable(sockfd_, timeout)) return false;

    socklen_t from_len = sizeof(out.from.addr);
    ssize_t n = recvfrom(sockfd_, rbuf_.data(), rbuf_.size(), 0, (sockaddr*)&out.from.addr, &from_len);
    if (n < 0) {
        // ICMP errors from an earlier send surface here on Linux; the peer may
        // simply not be up yet.
        if (errno == EINTR || errno == EAGAIN || errno == ECONNREFUSED) return false;
        throw TransportError(errno, "recvfrom");
    }
    out.bytes.assign(rbuf_.begin(), rbuf_.begin() + n);
    return true;
}

std::unique_ptr<StreamTransport> StreamTransport::listen(uint16_t port) {
    std::unique_ptr<StreamTransport> t(new StreamTransport());
    t->listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (t->listen_fd_ < 0) throw TransportError(errno, "socket");

    int one = 1;
    setsockopt(t->listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);
    if (bind(t->listen_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) throw TransportError(errno, "bind");
    if (::listen(t->listen_fd_, 1) < 0) throw TransportError(errno, "listen");
    return t;
}

std::unique_ptr<StreamTransport> StreamTransport::connect(const PeerAddress& peer) {
    std::unique_ptr<StreamTransport> t(new StreamTransport());
    t->conn_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (t->conn_fd_ < 0) throw TransportError(errno, "socket");
    if (::connect(t->conn_fd_, (const sockaddr*)&peer.addr, sizeof(peer.addr)) != 0) {
        throw TransportError(errno, "connect " + peer_to_string(peer));
    }
    t->peer_ = peer;
    return t;
}

StreamTransport::~StreamTransport() {
    if (conn_fd_ >= 0) ::close(conn_fd_);
    if (listen_fd_ >= 0) ::close(listen_fd_);
}

uint16_t StreamTransport::local_port() const {
    return bound_port(listen_fd_ >= 0 ? listen_fd_ : conn_fd_);
}

bool StreamTransport::accept_peer(std::chrono::milliseconds timeout) {
    if (!wait_readable(listen_fd_, timeout)) return false;
    socklen_t len = sizeof(peer_.addr);
    int fd = ::accept(listen_fd_, (sockaddr*)&peer_.addr, &len);
    if (fd < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) return false;
        throw TransportError(errno, "accept");
    }
    conn_fd_ = fd;
    return true;
}

bool StreamTransport::send(const PeerAddress&, const uint8_t* data, size_t len) {
    if (conn_fd_ < 0) return false;  // no peer connected yet

    std::vector<uint8_t> frame(4 + len);
    uint32_t be = htonl(static_cast<uint32_t>(len));
    std::memcpy(frame.data(), &be, 4);
    if (len > 0) std::memcpy(frame.data() + 4, data, len);

    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t rc = ::send(conn_fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno, "send " + peer_to_string(peer_));
        }
        sent += static_cast<size_t>(rc);
    }
    return true;
}

void StreamTransport::read_exact(uint8_t* out, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t rc = ::recv(conn_fd_, out + got, len - got, 0);
        if (rc == 0) throw TransportError(ECONNRESET, "peer closed stream");
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno, "recv");
        }
        got += static_cast<size_t>(rc);
    }
}

bool StreamTransport::receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) {
    if (conn_fd_ < 0 && !accept_peer(timeout)) return false;
    if (!wait_readable(conn_fd_, timeout)) return false;

    uint8_t hdr[4];
    read_exact(hdr, sizeof(hdr));
    uint32_t be = 0;
    std::memcpy(&be, hdr, 4);
    uint32_t len = ntohl(be);
    if (len > MAX_DATAGRAM) throw TransportError(EMSGSIZE, "oversized stream frame");

    out.bytes.resize(len);
    if (len > 0) read_exact(out.bytes.data(), len);
    out.from = peer_;
    return true;
}

LossyTransport::LossyTransport(std::unique_ptr<Transport> inner, double loss, uint32_t seed)
    : inner_(std::move(inner)), loss_(loss), rng_(seed) {}

bool LossyTransport::send(const PeerAddress& to, const uint8_t* data, size_t len) {
    if (loss_ > 0.0 && dist_(rng_) < loss_) {
        ++dropped_;
        return true;  // lost on the wire as far as the caller can tell
    }
    return inner_->send(to, data, len);
}

bool LossyTransport::receive_with_timeout(std::chrono::milliseconds timeout, Datagram& out) {
    return inner_->receive_with_timeout(timeout, out);
}

static std::unique_ptr<Transport> wrap_lossy(std::unique_ptr<Transport> t, double loss, uint32_t seed) {
    if (loss <= 0.0) return t;
    return std::make_unique<LossyTransport>(std::move(t), loss, seed);
}

std::unique_ptr<Transport> make_listening_transport(TransportMode mode, uint16_t port, double loss, uint32_t seed) {
    std::unique_ptr<Transport> t;
    if (mode == TransportMode::Stream) {
        t = StreamTransport::listen(port);
    } else {
        t = std::make_unique<UdpTransport>(port);
    }
    return wrap_lossy(std::move(t), loss, seed);
}

std::unique_ptr<Transport> make_connecting_transport(TransportMode mode, const PeerAddress& peer, double loss, uint32_t seed) {
    std::unique_ptr<Transport> t;
    if (mode == TransportMode::Stream) {
        t = StreamTransport::connect(peer);
    } else {
        t = std::make_unique<UdpTransport>(0);
    }
    return wrap_lossy(std::move(t), loss, seed);
}
