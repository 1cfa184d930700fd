// Receiver side in-order reassembly
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "us_common.hpp"

enum class ReceiveState { AwaitingFirstPacket, Receiving, Complete, Aborted };

struct ReceiveStats {
    uint64_t accepted = 0;
    uint64_t rejected = 0;      // every NACKed packet; reported as packets lost
    uint64_t out_of_order = 0;  // stale duplicates and early arrivals
    uint64_t corrupted = 0;     // checksum or length mismatch
    uint64_t malformed = 0;     // shorter than a header
};

// Accepts payloads strictly in sequence order into one contiguous buffer.
// Anything else is discarded and answered with NACK(expected_index).
class ReceiveWindow {
public:
    explicit ReceiveWindow(uint64_t announced_size);

    // Returns true when reply must be sent back to the sender. The sentinel
    // and datagrams arriving after completion produce no reply.
    bool on_datagram(const uint8_t* data, size_t len, ControlPacket& reply);
    bool on_datagram(const std::vector<uint8_t>& bytes, ControlPacket& reply) {
        return on_datagram(bytes.data(), bytes.size(), reply);
    }

    // pkt has already passed decoding.
    bool on_data(const DataPacket& pkt, ControlPacket& reply);

    ReceiveState state() const { return state_; }
    bool complete() const { return state_ == ReceiveState::Complete; }
    bool aborted() const { return state_ == ReceiveState::Aborted; }
    uint64_t expected_index() const { return expected_; }
    uint64_t total_bytes_accepted() const { return total_; }
    uint64_t announced_size() const { return announced_; }
    const std::vector<uint8_t>& buffer() const { return buffer_; }
    const ReceiveStats& stats() const { return stats_; }

private:
    bool nack(ControlPacket& reply);

    uint64_t announced_;
    uint64_t expected_ = 0;
    uint64_t total_ = 0;
    std::vector<uint8_t> buffer_;
    ReceiveState state_ = ReceiveState::AwaitingFirstPacket;
    ReceiveStats stats_;
};
