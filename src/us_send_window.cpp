#include "us_send_window.hpp"

#include <stdexcept>
#include <utility>

#include "us_codec.hpp"

SendWindow::SendWindow(std::istream& source, uint32_t packet_capacity, uint32_t window_size)
    : source_(source), capacity_(packet_capacity), window_size_(window_size), chunk_(packet_capacity) {
    if (packet_capacity == 0 || window_size == 0) {
        throw std::invalid_argument("packet capacity and window size must be positive");
    }
}

size_t SendWindow::fill() {
    size_t admitted = 0;
    while (window_.size() < window_size_ && !exhausted_) {
        source_.read(reinterpret_cast<char*>(chunk_.data()), static_cast<std::streamsize>(capacity_));
        if (source_.bad()) throw TransferError(TransferFailure::FileError, "read input file");
        size_t n = static_cast<size_t>(source_.gcount());
        if (n < capacity_) exhausted_ = true;
        if (n == 0) break;

        WindowSlot slot;
        slot.index = next_++;
        slot.wire = encode_data(slot.index, chunk_.data(), n);
        slot.payload_bytes = n;
        window_.push_back(std::move(slot));
        ++admitted;
    }
    if (exhausted_ && state_ == SendState::Filling) state_ = SendState::Draining;
    return admitted;
}

bool SendWindow::transmit_pending(Transport& transport, const PeerAddress& peer) {
    for (auto& slot : window_) {
        if (slot.state != SlotState::Pending) continue;
        // Order must be preserved: a packet that could not be written blocks
        // every packet behind it.
        if (!transport.send(peer, slot.wire)) return false;
        slot.state = SlotState::AwaitingAck;
        if (slot.sends > 0) ++stats_.retransmissions;
        ++slot.sends;
        ++stats_.packets_sent;
        stats_.bytes_sent += slot.payload_bytes;
    }
    return true;
}

size_t SendWindow::awaiting_ack() const {
    size_t n = 0;
    for (const auto& slot : window_) {
        if (slot.state == SlotState::AwaitingAck) ++n;
    }
    return n;
}

void SendWindow::go_back_n() {
    for (auto& slot : window_) slot.state = SlotState::Pending;
}

void SendWindow::evict_acknowledged() {
    while (!window_.empty() && window_.front().state == SlotState::Acknowledged) {
        stats_.bytes_acked += window_.front().payload_bytes;
        base_ = window_.front().index + 1;
        window_.pop_front();
    }
}

void SendWindow::on_timeout() {
    ++stats_.timeouts;
    go_back_n();
    fill();
}

void SendWindow::on_control(const ControlPacket& ctrl) {
    if (ctrl.status == ControlStatus::Ack && ctrl.index == base_ && !window_.empty()) {
        window_.front().state = SlotState::Acknowledged;
        evict_acknowledged();
        fill();
        ++stats_.successes;
        return;
    }

    // NACK(k) asks for a resend starting at k, so everything below k has
    // been accepted. Sliding the base keeps lost ACKs from stalling progress.
    if (ctrl.status == ControlStatus::Nack && ctrl.index > base_ && ctrl.index <= next_) {
        for (auto& slot : window_) {
            if (slot.index < ctrl.index) slot.state = SlotState::Acknowledged;
        }
        evict_acknowledged();
        fill();
    }

    go_back_n();
    ++stats_.failures;
}

void SendWindow::mark_delivered() {
    for (auto& slot : window_) slot.state = SlotState::Acknowledged;
    evict_acknowledged();
    exhausted_ = true;
    if (state_ == SendState::Filling) state_ = SendState::Draining;
}

bool SendWindow::close(Transport& transport, const PeerAddress& peer) {
    if (!drained()) throw std::logic_error("close() with data still in flight");
    if (!transport.send(peer, encode_sentinel(capacity_))) return false;
    state_ = SendState::Closing;
    return true;
}
