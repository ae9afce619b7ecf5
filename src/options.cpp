#include "options.hpp"
#include "serial_port.hpp"

#include <getopt.h>

#include <stdexcept>

namespace repatcher {

// ------------------ helpers ------------------
static bool parse_int(const char* s, long lo, long hi, long& out) {
    try {
        size_t used = 0;
        const std::string str(s);
        long v = std::stol(str, &used, 10);
        if (used != str.size() || v < lo || v > hi) return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void print_usage(const char* prog, std::ostream& os) {
    const Options d;
    os << "usage: " << prog << " [-h] [--version] [-a ADDR] [-p PORT] [-u USB_PORT]"
       << " [-r USB_RATE] [-v]\n\n"
       << "Publish rePatcher knob and patch bay data as OSC.\n\n"
       << "  -h, --help              show this help message and exit\n"
       << "  --version               show program's version number and exit\n"
       << "  -a, --addr ADDR         IP address for publishing OSC messages (default: "
       << d.osc_host << ")\n"
       << "  -p, --port PORT         port for publishing OSC messages (default: "
       << d.osc_port << ")\n"
       << "  -u, --usb_port USB_PORT rePatcher USB port (default: " << d.usb_port << ")\n"
       << "  -r, --usb_rate USB_RATE rePatcher baud rate (default: " << d.usb_rate << ")\n"
       << "  -v, --verbose           print parsed rePatcher data as it is read in (default: off)\n";
}

ParseResult parse_options(int argc, char* argv[], Options& out, std::ostream& os, std::string* err) {
    enum { OPT_VERSION = 1000 };
    static const option long_opts[] = {
        {"help",     no_argument,       nullptr, 'h'},
        {"version",  no_argument,       nullptr, OPT_VERSION},
        {"addr",     required_argument, nullptr, 'a'},
        {"port",     required_argument, nullptr, 'p'},
        {"usb_port", required_argument, nullptr, 'u'},
        {"usb_rate", required_argument, nullptr, 'r'},
        {"verbose",  no_argument,       nullptr, 'v'},
        {nullptr,    0,                 nullptr, 0}
    };

    Options opts;
    const char* prog = argc > 0 ? argv[0] : "repatcher_osc";

    // getopt keeps global state; 0 makes glibc reinitialise it on every call
    optind = 0;
    opterr = 0;

    int c;
    while ((c = getopt_long(argc, argv, ":ha:p:u:r:v", long_opts, nullptr)) != -1) {
        long v = 0;
        switch (c) {
        case 'h':
            print_usage(prog, os);
            return ParseResult::Exit;
        case OPT_VERSION:
            os << kVersion << "\n";
            return ParseResult::Exit;
        case 'a':
            opts.osc_host = optarg;
            break;
        case 'p':
            if (!parse_int(optarg, 1, 65535, v)) {
                if (err) *err = std::string("invalid port: ") + optarg;
                return ParseResult::Error;
            }
            opts.osc_port = static_cast<uint16_t>(v);
            break;
        case 'u':
            opts.usb_port = optarg;
            break;
        case 'r':
            if (!parse_int(optarg, 1, 4000000, v) || !is_supported_baud(static_cast<int>(v))) {
                if (err) *err = std::string("unsupported baud rate: ") + optarg;
                return ParseResult::Error;
            }
            opts.usb_rate = static_cast<int>(v);
            break;
        case 'v':
            opts.verbose = true;
            break;
        case ':':
            if (err) *err = std::string("missing argument for ") + argv[optind - 1];
            return ParseResult::Error;
        default:
            // optind has not moved past a cluster like "-xv" yet; optopt is 0
            // only for unknown long options
            if (err) {
                *err = "unrecognized argument: ";
                if (optopt != 0) *err += std::string("-") + static_cast<char>(optopt);
                else *err += argv[optind - 1];
            }
            return ParseResult::Error;
        }
    }
    if (optind < argc) {
        if (err) *err = std::string("unrecognized argument: ") + argv[optind];
        return ParseResult::Error;
    }

    out = opts;
    return ParseResult::Run;
}

} // namespace repatcher
