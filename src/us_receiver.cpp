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
              << " [--packet N] [--timeout SEC] [--max-attempts N] [--duration SEC]"
                 " [--loss P] [--seed N] [--stream] [--verbose] <output_dir> <sender_ip> <sender_port>\n";
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
    if (argc - argi != 3) {
        usage(argv[0]);
        return 1;
    }
    const std::string out_dir = argv[argi++];
    const std::string host = argv[argi++];
    int port = std::atoi(argv[argi++]);
    if (port <= 0 || port > 65535) {
        std::cerr << "Port must be between 1 and 65535\n";
        return 1;
    }

    std::signal(SIGINT, on_sigint);
    opts.session.cancel = &g_stop;

    try {
        PeerAddress sender = resolve_peer(host, static_cast<uint16_t>(port));
        std::unique_ptr<Transport> transport = make_connecting_transport(opts.mode, sender, opts.loss, opts.seed);
        ReceiveReport r = run_receiver(*transport, sender, out_dir, opts.session);

        double secs = r.elapsed.count() > 0.0 ? r.elapsed.count() : 1e-6;
        std::cout << "File received: " << r.output_path << "\n";
        std::cout << "File size = " << format_bytes(static_cast<double>(r.file_size)) << " (" << r.file_size << " bytes)\n";
        std::cout << "Elapsed time = " << secs << " sec\n";
        std::cout << "Throughput = " << (r.file_size * 8.0) / 1e6 / secs << " Mbit/s\n";
        std::cout << "Rejected packets = " << r.window.rejected << " (" << r.window.out_of_order << " out of order, "
                  << r.window.corrupted << " corrupted)\n";
        if (r.peer_bytes_received) {
            std::cout << "Sender transmitted " << r.peer_transmitted_bytes << " payload bytes\n";
        }
        if (!r.stats_error.empty() && opts.session.verbose) {
            std::cout << "Statistics exchange incomplete: " << r.stats_error << "\n";
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
