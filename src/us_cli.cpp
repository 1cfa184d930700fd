#include "us_cli.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "us_session.hpp"

// Whole-string unsigned 32-bit value; std::stoul alone accepts "-1" and wraps.
static uint32_t parse_u32(const std::string& value, const std::string& flag) {
    size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos || value[first] == '-' || value[first] == '+') {
        throw std::invalid_argument(flag + " needs a non-negative integer");
    }
    size_t used = 0;
    unsigned long v = std::stoul(value, &used);
    if (used != value.size()) throw std::invalid_argument(flag + " needs a non-negative integer");
    if (v > std::numeric_limits<uint32_t>::max()) throw std::out_of_range(flag + " is too large");
    return static_cast<uint32_t>(v);
}

static double parse_double(const std::string& value, const std::string& flag) {
    size_t used = 0;
    double v = std::stod(value, &used);
    if (used != value.size()) throw std::invalid_argument(flag + " needs a number");
    return v;
}

int parse_cli(int argc, char** argv, CliOptions& opts) {
    int argi = 1;
    std::string value;

    // Accepts both "--name V" and "--name=V"
    auto take = [&](const std::string& a, const char* name) -> bool {
        std::string flag(name);
        if (a == flag) {
            if (argi + 1 >= argc) throw std::invalid_argument("missing value for " + flag);
            value = argv[++argi];
            return true;
        }
        if (a.rfind(flag + "=", 0) == 0) {
            value = a.substr(flag.size() + 1);
            return true;
        }
        return false;
    };

    try {
        while (argi < argc && std::strncmp(argv[argi], "--", 2) == 0) {
            std::string a = argv[argi];
            if (take(a, "--packet")) {
                opts.session.packet_capacity = parse_u32(value, "--packet");
            } else if (take(a, "--window")) {
                opts.session.window_size = parse_u32(value, "--window");
            } else if (take(a, "--timeout")) {
                double secs = parse_double(value, "--timeout");
                if (!(secs > 0.0)) throw std::invalid_argument("timeout must be positive");
                long ms = std::lround(secs * 1000.0);
                opts.session.retransmission_timeout = std::chrono::milliseconds(ms > 0 ? ms : 1);
            } else if (take(a, "--max-attempts")) {
                opts.session.max_attempts = parse_u32(value, "--max-attempts");
            } else if (take(a, "--duration")) {
                opts.session.run_duration = std::chrono::seconds(parse_u32(value, "--duration"));
            } else if (take(a, "--loss")) {
                opts.loss = parse_double(value, "--loss");
                if (opts.loss < 0.0 || opts.loss >= 1.0) throw std::invalid_argument("loss must be in [0, 1)");
            } else if (take(a, "--seed")) {
                opts.seed = parse_u32(value, "--seed");
            } else if (a == "--stream") {
                opts.mode = TransportMode::Stream;
            } else if (a == "--verbose") {
                opts.session.verbose = true;
            } else if (a == "--help") {
                opts.help = true;
            } else {
                std::cerr << "Unknown option: " << a << "\n";
                return -1;
            }
            ++argi;
        }
        validate_config(opts.session);
    } catch (const std::exception& e) {
        // std::stoul / std::stod report bad numbers as invalid_argument or out_of_range
        std::cerr << "Bad option " << (argi < argc ? argv[argi] : "") << ": " << e.what() << "\n";
        return -1;
    }
    return argi;
}

std::string format_bytes(double size) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int index = 0;
    while (size > 1024 && index < 4) {
        size /= 1024;
        ++index;
    }
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f %s", size, units[index]);
    return buf;
}
