// Command-line parsing shared by us_sender and us_receiver
#pragma once

#include <cstdint>
#include <string>

#include "us_common.hpp"
#include "us_transport.hpp"

struct CliOptions {
    SessionConfig session;
    double loss = 0.0;
    uint32_t seed = 1;
    TransportMode mode = TransportMode::Datagram;
    bool help = false;
};

// Consumes leading --options. Returns the index of the first positional
// argument, or -1 after printing the problem to std::cerr.
int parse_cli(int argc, char** argv, CliOptions& opts);

std::string format_bytes(double size);
