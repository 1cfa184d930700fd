#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "us_cli.hpp"
#include "us_common.hpp"
#include "us_session.hpp"
#include "us_transport.hpp"

static std::atomic<bool> g_stop{false};

static void on_sigint(int) {
    g_stop = true;
}

static void usage(const char* prog) {
    std::cout << "Usage: " << prog
              << " [--packet N] [--window N] [--timeout SEC] [--max-attempts N] [--duration SEC]"
                 " [--loss P] [--seed N] [--stream] [--verbose] <input_file_path> <listen_port>\n";
}

static void report(const SendReport& r, uint32_t packet_capacity) {
    double secs = r.elapsed.count() > 0.0 ? r.elapsed.count() : 1e-6;
    uint64_t packets = (r.file_size + packet_capacity - 1) / packet_capacity;

    std::cout << "Report for " << packet_capacity << "-byte packets\n";
    std::cout << "File size = " << format_bytes(static_cast<double>(r.file_size)) << " (" << r.file_size << " bytes)\n";
    std::cout << "Packets = " << packets << " (" << r.window.packets_sent << " sent)\n";
    std::cout << "Elapsed time = " << secs << " sec\n";
    std::cout << "Throughput = " << (r.file_size * 8.0) / 1e6 / secs << " Mbit/s\n";
    std::cout << "Retransmitted packets = " << r.window.retransmissions
              << " (" << r.window.failures << " negative responses, " << r.window.timeouts << " timeouts)\n";
    if (r.peer_stats_received) {
        std::cout << "Receiver accepted " << r.peer_stats.bytes_accepted << " bytes, rejected "
                  << r.peer_stats.packets_lost << " packets\n";
    } else {
        std::cout << "Receiver statistics unavailable\n";
    }
}

int main(int argc, char** argv) {
    CliOptions opts;
    int argi = parse_cli(argc, argv, opts);
    if (argi < 0) {
        usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        usage(argv[0]);
        return 0;
    }
    if (argc - argi != 2) {
        usage(argv[0]);
        return 1;
    }
    const std::string in_path = argv[argi++];
    int port = std::atoi(argv[argi++]);
    if (port <= 0 || port > 65535) {
        std::cerr << "Port must be between 1 and 65535\n";
        return 1;
    }

    std::signal(SIGINT, on_sigint);
    opts.session.cancel = &g_stop;

    try {
        std::unique_ptr<Transport> transport =
            make_listening_transport(opts.mode, static_cast<uint16_t>(port), opts.loss, opts.seed);
        std::cout << "Waiting for a receiver on port " << port << "...\n";
        SendReport r = run_sender(*transport, in_path, opts.session);
        std::cout << "File sent: " << r.file_name << " to " << peer_to_string(r.peer) << "\n";
        report(r, opts.session.packet_capacity);
        if (const LossyTransport* lossy = dynamic_cast<const LossyTransport*>(transport.get())) {
            std::cout << "Simulated losses = " << lossy->dropped() << " datagrams\n";
        }
    } catch (const TransferError& e) {
        std::cerr << "Transfer failed: " << e.what() << "\n";
        return 1;
    } catch (const TransportError& e) {
        std::cerr << "Network error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
