// Common definitions for the windowed UDP file share protocol
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// Protocol constants
static constexpr uint32_t DEFAULT_PACKET_CAPACITY = 1024;  // payload per DATA
static constexpr uint32_t DEFAULT_WINDOW_SIZE = 8;         // packets in flight
static constexpr uint32_t MAX_WINDOW_SIZE = 65536;
static constexpr int STATS_ATTEMPTS = 5;                   // timeouts tolerated in the stats exchange
static constexpr size_t MAX_DATAGRAM = 65507;              // largest UDP payload over IPv4

// Wire layout sizes (big-endian integers)
static constexpr size_t INDEX_BYTES = 8;
static constexpr size_t LENGTH_BYTES = 8;
static constexpr size_t CHECKSUM_BYTES = 32;
static constexpr size_t DATA_HEADER_BYTES = INDEX_BYTES + LENGTH_BYTES + CHECKSUM_BYTES;  // 48
static constexpr size_t STATS_BYTES = 16;         // bytes_accepted + packets_lost
static constexpr size_t STATS_REPLY_BYTES = 8;    // sender's transmitted byte count
static constexpr uint8_t CONFIRMATION_BYTE = 0x01;

enum class ControlStatus { Ack, Nack };

enum class DecodeError {
    None,
    MalformedPacket,   // shorter than the fixed header
    ChecksumMismatch,  // digest does not match the payload
    LengthMismatch,    // declared payload length differs from bytes present
    UnknownStatus      // control status other than ACK / NACK
};

struct DataPacket {
    uint64_t index = 0;
    uint64_t length = 0;
    char checksum[CHECKSUM_BYTES] = {};
    std::vector<uint8_t> payload;
};

struct ControlPacket {
    uint64_t index = 0;
    ControlStatus status = ControlStatus::Ack;
};

// Handshake offer sent by the sender once the receiver signals readiness
struct FileOffer {
    uint64_t file_size = 0;
    std::string file_name;
};

// Receiver-side totals sent after the last byte was accepted
struct TransferStatsMsg {
    uint64_t bytes_accepted = 0;
    uint64_t packets_lost = 0;
};

struct SessionConfig {
    uint32_t packet_capacity = DEFAULT_PACKET_CAPACITY;
    uint32_t window_size = DEFAULT_WINDOW_SIZE;
    std::chrono::milliseconds retransmission_timeout{1000};
    uint32_t max_attempts = 0;            // consecutive idle timeouts; 0 = retry forever
    std::chrono::seconds run_duration{0}; // whole-session deadline; 0 = none
    bool verbose = false;
    const std::atomic<bool>* cancel = nullptr;
};

// Failure below the protocol layer; the session cannot continue.
class TransportError : public std::system_error {
public:
    TransportError(int err, const std::string& what)
        : std::system_error(err, std::generic_category(), what) {}
};

enum class TransferFailure {
    Cancelled,
    RetryBudgetExhausted,
    DeadlineExceeded,
    Incomplete,
    FileError,
    BadOffer
};

class TransferError : public std::runtime_error {
public:
    TransferError(TransferFailure reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}
    TransferFailure reason() const { return reason_; }

private:
    TransferFailure reason_;
};
