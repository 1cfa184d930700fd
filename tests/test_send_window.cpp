#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "us_codec.hpp"
#include "us_send_window.hpp"

namespace {

// Records what the window writes; can refuse one send call to simulate a
// transient failure.
class RecordingTransport : public Transport {
public:
    bool send(const PeerAddress&, const uint8_t* data, size_t len) override {
        if (++calls == fail_on_call) return false;
        sent.emplace_back(data, data + len);
        return true;
    }
    bool receive_with_timeout(std::chrono::milliseconds, Datagram&) override { return false; }
    using Transport::send;

    std::vector<uint64_t> indices() const {
        std::vector<uint64_t> out;
        for (const auto& s : sent) out.push_back(get_u64(s.data()));
        return out;
    }

    std::vector<std::vector<uint8_t>> sent;
    int calls = 0;
    int fail_on_call = 0;  // 1-based send call that reports a transient failure
};

ControlPacket ack(uint64_t i) {
    ControlPacket c;
    c.index = i;
    c.status = ControlStatus::Ack;
    return c;
}

ControlPacket nack(uint64_t i) {
    ControlPacket c;
    c.index = i;
    c.status = ControlStatus::Nack;
    return c;
}

std::string file_of(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + i % 26);
    return s;
}

const PeerAddress peer{};

}  // namespace

TEST(SendWindow, FillStopsAtWindowSize) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    EXPECT_EQ(sw.fill(), 4u);
    EXPECT_EQ(sw.in_flight(), 4u);
    EXPECT_EQ(sw.next_index(), 4u);
    EXPECT_EQ(sw.fill(), 0u);
    EXPECT_EQ(sw.state(), SendState::Filling);

    RecordingTransport t;
    ASSERT_TRUE(sw.transmit_pending(t, peer));
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{0, 1, 2, 3}));
    EXPECT_EQ(sw.awaiting_ack(), 4u);

    // Nothing new is written until something is acknowledged
    ASSERT_TRUE(sw.transmit_pending(t, peer));
    EXPECT_EQ(t.sent.size(), 4u);
}

TEST(SendWindow, AckForBaseSlidesByOne) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);

    sw.on_control(ack(0));
    EXPECT_EQ(sw.base_index(), 1u);
    EXPECT_EQ(sw.in_flight(), 4u);
    EXPECT_EQ(sw.awaiting_ack(), 3u);
    EXPECT_EQ(sw.window().back().index, 4u);
    EXPECT_EQ(sw.window().back().state, SlotState::Pending);
    EXPECT_EQ(sw.stats().successes, 1u);

    sw.transmit_pending(t, peer);
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(sw.stats().bytes_acked, 500u);
}

TEST(SendWindow, NackResendsWholeWindow) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);
    sw.on_control(ack(0));
    sw.transmit_pending(t, peer);
    t.sent.clear();

    sw.on_control(nack(1));
    EXPECT_EQ(sw.base_index(), 1u);
    EXPECT_EQ(sw.awaiting_ack(), 0u);
    EXPECT_EQ(sw.stats().failures, 1u);

    sw.transmit_pending(t, peer);
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{1, 2, 3, 4}));
    EXPECT_EQ(sw.stats().retransmissions, 4u);
}

TEST(SendWindow, AckForOtherThanBaseResendsWithoutSliding) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);

    sw.on_control(ack(2));
    EXPECT_EQ(sw.base_index(), 0u);
    EXPECT_EQ(sw.in_flight(), 4u);
    EXPECT_EQ(sw.awaiting_ack(), 0u);
    EXPECT_EQ(sw.stats().failures, 1u);
    EXPECT_EQ(sw.stats().successes, 0u);
}

TEST(SendWindow, NackAheadOfBaseAcknowledgesEverythingBelow) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);
    t.sent.clear();

    // ACKs for 0 and 1 were lost; the receiver now wants 2
    sw.on_control(nack(2));
    EXPECT_EQ(sw.base_index(), 2u);
    EXPECT_EQ(sw.window().front().index, 2u);
    EXPECT_EQ(sw.stats().bytes_acked, 1000u);

    sw.transmit_pending(t, peer);
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{2, 3, 4}));
}

TEST(SendWindow, StaleNackBelowBaseStillResends) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);
    sw.on_control(ack(0));
    sw.on_control(ack(1));
    sw.transmit_pending(t, peer);

    sw.on_control(nack(0));
    EXPECT_EQ(sw.base_index(), 2u);
    EXPECT_EQ(sw.awaiting_ack(), 0u);
}

TEST(SendWindow, TimeoutResendsEverythingInFlight) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);
    t.sent.clear();

    sw.on_timeout();
    EXPECT_EQ(sw.stats().timeouts, 1u);
    sw.transmit_pending(t, peer);
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{0, 1, 2, 3}));
}

TEST(SendWindow, TransientFailureKeepsOrder) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    t.fail_on_call = 3;
    sw.fill();

    EXPECT_FALSE(sw.transmit_pending(t, peer));
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{0, 1}));
    EXPECT_EQ(sw.window()[2].state, SlotState::Pending);
    EXPECT_EQ(sw.window()[3].state, SlotState::Pending);

    EXPECT_TRUE(sw.transmit_pending(t, peer));
    EXPECT_EQ(t.indices(), (std::vector<uint64_t>{0, 1, 2, 3}));
    EXPECT_EQ(sw.awaiting_ack(), 4u);
    EXPECT_EQ(sw.stats().retransmissions, 0u);
}

TEST(SendWindow, DrainsThenClosesWithSentinel) {
    std::istringstream in(file_of(700));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    EXPECT_EQ(sw.fill(), 2u);
    EXPECT_EQ(sw.state(), SendState::Draining);
    sw.transmit_pending(t, peer);

    EXPECT_THROW(sw.close(t, peer), std::logic_error);

    sw.on_control(ack(0));
    EXPECT_FALSE(sw.drained());
    sw.on_control(ack(1));
    ASSERT_TRUE(sw.drained());
    EXPECT_EQ(sw.stats().bytes_acked, 700u);

    ASSERT_TRUE(sw.close(t, peer));
    EXPECT_EQ(sw.state(), SendState::Closing);
    const auto& last = t.sent.back();
    EXPECT_EQ(last.size(), DATA_HEADER_BYTES + 500);
    EXPECT_TRUE(is_sentinel(last.data(), last.size()));

    sw.finish();
    EXPECT_EQ(sw.state(), SendState::Done);
}

TEST(SendWindow, ExactMultipleOfCapacityDrains) {
    std::istringstream in(file_of(1000));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    EXPECT_EQ(sw.in_flight(), 2u);
    sw.transmit_pending(t, peer);
    sw.on_control(ack(0));
    sw.on_control(ack(1));
    EXPECT_TRUE(sw.drained());
    EXPECT_EQ(sw.next_index(), 2u);
}

TEST(SendWindow, EmptyFileHasNothingInFlight) {
    std::istringstream in("");
    SendWindow sw(in, 500, 4);
    EXPECT_EQ(sw.fill(), 0u);
    EXPECT_TRUE(sw.drained());
    RecordingTransport t;
    ASSERT_TRUE(sw.close(t, peer));
    EXPECT_EQ(t.sent.size(), 1u);
}

TEST(SendWindow, MarkDeliveredEmptiesWindow) {
    std::istringstream in(file_of(2500));
    SendWindow sw(in, 500, 4);
    RecordingTransport t;
    sw.fill();
    sw.transmit_pending(t, peer);
    sw.mark_delivered();
    EXPECT_TRUE(sw.drained());
    EXPECT_EQ(sw.in_flight(), 0u);
}

TEST(SendWindow, RejectsZeroSizes) {
    std::istringstream in("abc");
    EXPECT_THROW(SendWindow(in, 0, 4), std::invalid_argument);
    EXPECT_THROW(SendWindow(in, 500, 0), std::invalid_argument);
}
