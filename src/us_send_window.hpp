// Sender side go-back-N window
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <istream>
#include <vector>

#include "us_common.hpp"
#include "us_transport.hpp"

enum class SlotState { Pending, AwaitingAck, Acknowledged };

enum class SendState { Filling, Draining, Closing, Done };

struct WindowSlot {
    uint64_t index = 0;
    std::vector<uint8_t> wire;  // encoded DataPacket
    size_t payload_bytes = 0;
    uint32_t sends = 0;
    SlotState state = SlotState::Pending;
};

struct SendStats {
    uint64_t packets_sent = 0;       // data packets written, retransmissions included
    uint64_t retransmissions = 0;    // data packets written more than once
    uint64_t bytes_sent = 0;         // payload bytes written, retransmissions included
    uint64_t bytes_acked = 0;
    uint64_t successes = 0;          // ACKs that advanced the base
    uint64_t failures = 0;           // NACKs and ACKs for anything but the base
    uint64_t timeouts = 0;
};

// Owns the in-flight packets of one transfer. Reads the file lazily from
// source, one packet_capacity chunk at a time, and never holds more than
// window_size packets.
class SendWindow {
public:
    SendWindow(std::istream& source, uint32_t packet_capacity, uint32_t window_size);

    // Admits new packets at the tail while there is room and data. Returns
    // the number admitted.
    size_t fill();

    // Writes every Pending packet in window order. Stops at the first
    // transient send failure and returns false; later packets stay Pending.
    bool transmit_pending(Transport& transport, const PeerAddress& peer);

    // No control packet arrived in time: the whole window is resent.
    void on_timeout();

    void on_control(const ControlPacket& ctrl);

    // The receiver reported every byte as accepted; treat the window as acked.
    void mark_delivered();

    // Sends the end-of-stream sentinel once the file is exhausted and the
    // window is empty. Returns false if the send must be retried.
    bool close(Transport& transport, const PeerAddress& peer);
    void finish() { state_ = SendState::Done; }

    SendState state() const { return state_; }
    bool drained() const { return exhausted_ && window_.empty(); }
    uint64_t base_index() const { return base_; }
    uint64_t next_index() const { return next_; }
    size_t in_flight() const { return window_.size(); }
    size_t awaiting_ack() const;
    const std::deque<WindowSlot>& window() const { return window_; }
    const SendStats& stats() const { return stats_; }

private:
    void go_back_n();
    void evict_acknowledged();

    std::istream& source_;
    uint32_t capacity_;
    uint32_t window_size_;
    std::deque<WindowSlot> window_;
    std::vector<uint8_t> chunk_;
    uint64_t base_ = 0;   // lowest unacknowledged index
    uint64_t next_ = 0;   // index of the next chunk read from source
    bool exhausted_ = false;
    SendState state_ = SendState::Filling;
    SendStats stats_;
};
