// Sender and receiver sessions: handshake, windowed transfer, stats exchange
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "us_common.hpp"
#include "us_receive_window.hpp"
#include "us_send_window.hpp"
#include "us_transport.hpp"

struct SendReport {
    std::string file_name;
    uint64_t file_size = 0;
    PeerAddress peer;
    SendStats window;
    bool peer_stats_received = false;
    TransferStatsMsg peer_stats;
    std::chrono::duration<double> elapsed{0};
};

struct ReceiveReport {
    std::string file_name;
    std::string output_path;
    uint64_t file_size = 0;
    ReceiveStats window;
    bool peer_bytes_received = false;
    uint64_t peer_transmitted_bytes = 0;
    bool peer_confirmed = false;
    std::string stats_error;  // why the stats exchange ended early, if it did
    std::chrono::duration<double> elapsed{0};
};

// Throws std::invalid_argument when an option is out of range.
void validate_config(const SessionConfig& cfg);

// Waits for one receiver to announce readiness, then streams file_path to it.
// Throws TransferError or TransportError when the transfer cannot finish.
SendReport run_sender(Transport& transport, const std::string& file_path, const SessionConfig& cfg);

// Announces readiness to sender, stores the offered file under output_dir.
// The file only appears once every announced byte was accepted.
ReceiveReport run_receiver(Transport& transport, const PeerAddress& sender, const std::string& output_dir,
                           const SessionConfig& cfg);

// Base name of an offered file; throws TransferError(BadOffer) if nothing usable remains.
std::string safe_file_name(const std::string& offered);
