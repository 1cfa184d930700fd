#include "us_receive_window.hpp"

#include <algorithm>

#include "us_codec.hpp"

static constexpr uint64_t MAX_RESERVE = 64ull * 1024 * 1024;

ReceiveWindow::ReceiveWindow(uint64_t announced_size) : announced_(announced_size) {
    buffer_.reserve(static_cast<size_t>(std::min(announced_size, MAX_RESERVE)));
    if (announced_ == 0) state_ = ReceiveState::Complete;
}

bool ReceiveWindow::nack(ControlPacket& reply) {
    ++stats_.rejected;
    reply.index = expected_;
    reply.status = ControlStatus::Nack;
    return true;
}

bool ReceiveWindow::on_datagram(const uint8_t* data, size_t len, ControlPacket& reply) {
    if (state_ == ReceiveState::Complete || state_ == ReceiveState::Aborted) return false;
    state_ = ReceiveState::Receiving;

    // End of stream is checked before anything else; reaching it with bytes
    // still missing ends the transfer as incomplete.
    if (is_sentinel(data, len)) {
        state_ = ReceiveState::Aborted;
        return false;
    }

    DataPacket pkt;
    DecodeError err = decode_data(data, len, pkt);
    if (err == DecodeError::MalformedPacket) {
        ++stats_.malformed;
        return nack(reply);
    }
    if (err != DecodeError::None) {
        ++stats_.corrupted;
        return nack(reply);
    }
    return on_data(pkt, reply);
}

bool ReceiveWindow::on_data(const DataPacket& pkt, ControlPacket& reply) {
    if (state_ == ReceiveState::Complete || state_ == ReceiveState::Aborted) return false;
    state_ = ReceiveState::Receiving;

    if (pkt.index != expected_) {
        ++stats_.out_of_order;
        return nack(reply);
    }
    if (pkt.length != pkt.payload.size()) {
        ++stats_.corrupted;
        return nack(reply);
    }

    buffer_.insert(buffer_.end(), pkt.payload.begin(), pkt.payload.end());
    total_ += pkt.payload.size();
    ++expected_;
    ++stats_.accepted;

    reply.index = expected_ - 1;
    reply.status = ControlStatus::Ack;
    if (total_ >= announced_) state_ = ReceiveState::Complete;
    return true;
}
