#pragma once
#include <cstdint>
#include <ostream>
#include <string>

namespace repatcher {

constexpr const char* kVersion = "1.0.0";

// Startup configuration, fixed for the life of the process.
struct Options {
    std::string osc_host = "127.0.0.1";
    uint16_t osc_port = 12000;
    std::string usb_port = "/dev/ttyACM0";
    int usb_rate = 38400;
    bool verbose = false;
};

enum class ParseResult {
    Run,    // options filled in, start the bridge
    Exit,   // --help or --version already printed
    Error   // bad command line, cause in *err
};

// Parse argv. --help and --version print to os.
ParseResult parse_options(int argc, char* argv[], Options& out,
                          std::ostream& os, std::string* err = nullptr);

void print_usage(const char* prog, std::ostream& os);

} // namespace repatcher
