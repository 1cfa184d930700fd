#include "us_session.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "us_codec.hpp"

using clock_type = std::chrono::steady_clock;

void validate_config(const SessionConfig& cfg) {
    if (cfg.packet_capacity == 0 || DATA_HEADER_BYTES + cfg.packet_capacity > MAX_DATAGRAM) {
        throw std::invalid_argument("packet capacity must be between 1 and " +
                                    std::to_string(MAX_DATAGRAM - DATA_HEADER_BYTES));
    }
    if (cfg.window_size == 0 || cfg.window_size > MAX_WINDOW_SIZE) {
        throw std::invalid_argument("window size must be between 1 and " + std::to_string(MAX_WINDOW_SIZE));
    }
    if (cfg.retransmission_timeout.count() <= 0) throw std::invalid_argument("timeout must be positive");
}

// Cancellation, deadline and retry budget shared by every wait of a session.
class LoopGuard {
public:
    explicit LoopGuard(const SessionConfig& cfg) : cfg_(cfg) {
        if (cfg.run_duration.count() > 0) {
            has_deadline_ = true;
            deadline_ = clock_type::now() + cfg.run_duration;
        }
    }

    void check() const {
        if (cfg_.cancel != nullptr && cfg_.cancel->load()) {
            throw TransferError(TransferFailure::Cancelled, "transfer cancelled");
        }
        if (has_deadline_ && clock_type::now() >= deadline_) {
            throw TransferError(TransferFailure::DeadlineExceeded, "run duration exceeded");
        }
    }

    bool cancelled() const { return cfg_.cancel != nullptr && cfg_.cancel->load(); }

    void idle(const char* phase) {
        ++idle_;
        if (cfg_.max_attempts > 0 && idle_ >= cfg_.max_attempts) {
            throw TransferError(TransferFailure::RetryBudgetExhausted,
                                std::string("peer silent for ") + std::to_string(idle_) + " timeouts while " + phase);
        }
    }

    void progress() { idle_ = 0; }

private:
    const SessionConfig& cfg_;
    bool has_deadline_ = false;
    clock_type::time_point deadline_{};
    uint32_t idle_ = 0;
};

static std::string base_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static const char* status_text(ControlStatus s) {
    return s == ControlStatus::Ack ? "ACK" : "NACK";
}

static void send_or_note(Transport& t, const PeerAddress& peer, const std::vector<uint8_t>& bytes,
                  const SessionConfig& cfg, const char* what) {
    if (!t.send(peer, bytes) && cfg.verbose) {
        std::cout << what << " deferred: transport busy\n";
    }
}

static void write_output(const std::string& path, const std::vector<uint8_t>& data) {
    std::string part = path + ".part";
    int fd = ::open(part.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        throw TransferError(TransferFailure::FileError, "open " + part + ": " + std::strerror(errno));
    }

    size_t done = 0;
    while (done < data.size()) {
        ssize_t w = ::write(fd, data.data() + done, data.size() - done);
        if (w < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(part.c_str());
            throw TransferError(TransferFailure::FileError, "write " + part + ": " + std::strerror(err));
        }
        done += static_cast<size_t>(w);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        int err = errno;
        ::unlink(part.c_str());
        throw TransferError(TransferFailure::FileError, "flush " + part + ": " + std::strerror(err));
    }
    if (std::rename(part.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(part.c_str());
        throw TransferError(TransferFailure::FileError, "rename " + part + ": " + std::strerror(err));
    }
}

std::string safe_file_name(const std::string& offered) {
    std::string name = base_name(offered);
    if (name.empty() || name == "." || name == ".." || name.find('\0') != std::string::npos) {
        throw TransferError(TransferFailure::BadOffer, "unusable file name offered: '" + offered + "'");
    }
    return name;
}

SendReport run_sender(Transport& transport, const std::string& file_path, const SessionConfig& cfg) {
    validate_config(cfg);
    LoopGuard guard(cfg);
    SendReport report;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) throw TransferError(TransferFailure::FileError, "open " + file_path);
    file.seekg(0, std::ios::end);
    std::streamoff end = file.tellg();
    if (end < 0) throw TransferError(TransferFailure::FileError, "size of " + file_path);
    file.seekg(0, std::ios::beg);
    report.file_size = static_cast<uint64_t>(end);
    report.file_name = base_name(file_path);

    // An empty datagram announces a receiver ready for the offer
    Datagram dg;
    while (true) {
        guard.check();
        if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) continue;
        if (dg.bytes.empty()) break;
    }
    const PeerAddress peer = dg.from;
    report.peer = peer;
    auto t0 = clock_type::now();
    if (cfg.verbose) std::cout << "Receiver ready at " << peer_to_string(peer) << "\n";

    FileOffer offer;
    offer.file_size = report.file_size;
    offer.file_name = report.file_name;
    const std::vector<uint8_t> offer_pkt = encode_offer(offer);
    send_or_note(transport, peer, offer_pkt, cfg, "offer");

    SendWindow window(file, cfg.packet_capacity, cfg.window_size);
    window.fill();

    bool heard_control = false;
    while (!window.drained()) {
        guard.check();
        if (!window.transmit_pending(transport, peer) && cfg.verbose) {
            std::cout << "Send deferred at base " << window.base_index() << "\n";
        }

        if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) {
            guard.idle("awaiting acknowledgements");
            if (cfg.verbose) std::cout << "Timeout, resending window from " << window.base_index() << "\n";
            window.on_timeout();
            continue;
        }
        if (!same_peer(dg.from, peer)) continue;

        if (dg.bytes.empty()) {
            // Receiver idle: either the offer or the whole window was lost
            guard.progress();
            if (!heard_control) send_or_note(transport, peer, offer_pkt, cfg, "offer");
            window.on_timeout();
            continue;
        }

        if (dg.bytes.size() == STATS_BYTES) {
            // Final ACKs were lost but the receiver already holds every byte
            TransferStatsMsg stats;
            if (decode_stats(dg.bytes.data(), dg.bytes.size(), stats) == DecodeError::None &&
                stats.bytes_accepted == report.file_size) {
                report.peer_stats_received = true;
                report.peer_stats = stats;
                window.mark_delivered();
            }
            continue;
        }

        ControlPacket ctrl;
        DecodeError err = decode_control(dg.bytes.data(), dg.bytes.size(), ctrl);
        if (err != DecodeError::None) {
            if (cfg.verbose) std::cout << "Dropped control packet: " << decode_error_name(err) << "\n";
            continue;
        }
        heard_control = true;
        guard.progress();
        if (cfg.verbose) {
            std::cout << "Response " << status_text(ctrl.status) << " " << ctrl.index
                      << ", expected " << window.base_index() << "\n";
        }
        window.on_control(ctrl);
    }

    bool sentinel_sent = window.close(transport, peer);
    int waits = 0;
    while (!report.peer_stats_received && waits < STATS_ATTEMPTS) {
        if (guard.cancelled()) break;
        if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) {
            ++waits;
            sentinel_sent = window.close(transport, peer);
            continue;
        }
        if (!same_peer(dg.from, peer)) continue;
        if (dg.bytes.size() != STATS_BYTES) continue;  // stale control traffic
        if (decode_stats(dg.bytes.data(), dg.bytes.size(), report.peer_stats) == DecodeError::None) {
            report.peer_stats_received = true;
        }
    }
    if (!sentinel_sent && cfg.verbose) std::cout << "End-of-stream packet could not be sent\n";

    if (report.peer_stats_received) {
        std::vector<uint8_t> reply(STATS_REPLY_BYTES);
        put_u64(reply.data(), window.stats().bytes_sent);
        send_or_note(transport, peer, reply, cfg, "stats reply");
        send_or_note(transport, peer, std::vector<uint8_t>(1, CONFIRMATION_BYTE), cfg, "confirmation");
        if (cfg.verbose && report.peer_stats.bytes_accepted != report.file_size) {
            std::cout << "Receiver accepted " << report.peer_stats.bytes_accepted << " of "
                      << report.file_size << " bytes\n";
        }
    }

    window.finish();
    report.window = window.stats();
    report.elapsed = clock_type::now() - t0;
    return report;
}

ReceiveReport run_receiver(Transport& transport, const PeerAddress& sender, const std::string& output_dir,
                           const SessionConfig& cfg) {
    validate_config(cfg);
    LoopGuard guard(cfg);
    ReceiveReport report;
    auto t0 = clock_type::now();

    const std::vector<uint8_t> ready;
    Datagram dg;
    FileOffer offer;
    guard.check();
    send_or_note(transport, sender, ready, cfg, "readiness");
    auto last_ready = clock_type::now();
    while (true) {
        guard.check();
        if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) {
            guard.idle("waiting for the file offer");
            send_or_note(transport, sender, ready, cfg, "readiness");
            last_ready = clock_type::now();
            continue;
        }
        if (!same_peer(dg.from, sender)) continue;
        guard.progress();

        // Data sent ahead of a lost offer must not be mistaken for one
        DataPacket early;
        bool skip = decode_data(dg.bytes.data(), dg.bytes.size(), early) == DecodeError::None ||
                    is_sentinel(dg.bytes.data(), dg.bytes.size());
        if (!skip && decode_offer(dg.bytes.data(), dg.bytes.size(), offer) == DecodeError::None &&
            !offer.file_name.empty()) {
            break;
        }
        // The sender is transmitting without our offer; remind it at most
        // once per timeout.
        if (clock_type::now() - last_ready >= cfg.retransmission_timeout) {
            send_or_note(transport, sender, ready, cfg, "readiness");
            last_ready = clock_type::now();
        }
    }

    report.file_name = safe_file_name(offer.file_name);
    report.file_size = offer.file_size;
    std::string dir = output_dir.empty() ? "." : output_dir;
    report.output_path = dir + "/" + report.file_name;
    if (cfg.verbose) {
        std::cout << "Offer received: " << report.file_name << " (" << report.file_size << " bytes)\n";
    }

    ReceiveWindow window(offer.file_size);
    while (!window.complete() && !window.aborted()) {
        guard.check();
        if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) {
            guard.idle("receiving data");
            send_or_note(transport, sender, ready, cfg, "keepalive");
            continue;
        }
        if (!same_peer(dg.from, sender)) continue;
        guard.progress();

        ControlPacket reply;
        if (window.on_datagram(dg.bytes, reply)) {
            if (cfg.verbose) {
                std::cout << "Sending " << status_text(reply.status) << " " << reply.index
                          << " (" << window.total_bytes_accepted() << "/" << offer.file_size << " bytes)\n";
            }
            send_or_note(transport, sender, encode_control(reply.index, reply.status), cfg, "control");
        }
    }
    report.window = window.stats();

    if (window.aborted()) {
        throw TransferError(TransferFailure::Incomplete,
                            "sender ended the stream after " + std::to_string(window.total_bytes_accepted()) +
                                " of " + std::to_string(offer.file_size) + " bytes");
    }
    write_output(report.output_path, window.buffer());

    TransferStatsMsg stats;
    stats.bytes_accepted = window.total_bytes_accepted();
    stats.packets_lost = window.stats().rejected;
    const std::vector<uint8_t> stats_pkt = encode_stats(stats);
    try {
        send_or_note(transport, sender, stats_pkt, cfg, "stats");
        int waits = 0;
        while (!report.peer_confirmed && waits < STATS_ATTEMPTS && !guard.cancelled()) {
            if (!transport.receive_with_timeout(cfg.retransmission_timeout, dg)) {
                ++waits;
                send_or_note(transport, sender, stats_pkt, cfg, "stats");
                continue;
            }
            if (!same_peer(dg.from, sender)) continue;
            if (dg.bytes.size() == STATS_REPLY_BYTES) {
                report.peer_transmitted_bytes = get_u64(dg.bytes.data());
                report.peer_bytes_received = true;
            } else if (dg.bytes.size() == 1 && dg.bytes[0] == CONFIRMATION_BYTE) {
                report.peer_confirmed = true;
            } else {
                // Retransmitted data or the end-of-stream packet: the sender
                // is still waiting for our totals
                send_or_note(transport, sender, stats_pkt, cfg, "stats");
            }
        }
        if (!report.peer_confirmed) report.stats_error = "no confirmation from sender";
    } catch (const TransportError& e) {
        // The file is already stored; only the summary exchange is lost
        report.stats_error = e.what();
    }

    report.elapsed = clock_type::now() - t0;
    return report;
}
