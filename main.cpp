#include "src/frame_reader.hpp"
#include "src/options.hpp"
#include "src/osc_sender.hpp"
#include "src/serial_port.hpp"

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_stop_flag{false};

static void signal_handler(int) {
    g_stop_flag.store(true, std::memory_order_relaxed);
}

// No SA_RESTART: a blocked serial read must return EINTR so the reader
// notices the stop flag.
static bool install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

int main(int argc, char* argv[]) {
    repatcher::Options opts;
    std::string err;

    switch (repatcher::parse_options(argc, argv, opts, std::cout, &err)) {
    case repatcher::ParseResult::Exit:
        return 0;
    case repatcher::ParseResult::Error:
        std::cerr << err << "\n";
        repatcher::print_usage(argv[0], std::cerr);
        return 1;
    case repatcher::ParseResult::Run:
        break;
    }

    std::cout << "Publishing OSC at " << opts.osc_host << ":" << opts.osc_port << "\n";
    auto sender = repatcher::OscSender::open(opts.osc_host, opts.osc_port, opts.verbose, &err);
    if (!sender) {
        std::cerr << err << "\n";
        return 1;
    }

    std::cout << "Opening rePatcher connection at " << opts.usb_port
              << " (" << opts.usb_rate << " baud)\n";
    auto port = repatcher::SerialPort::open(opts.usb_port, opts.usb_rate, &err);
    if (!port) {
        std::cerr << err << "\n";
        return 1;
    }

    if (!install_signal_handlers()) {
        std::cerr << "sigaction: " << std::strerror(errno) << "\n";
        return 1;
    }

    repatcher::FrameReader reader(*port, *sender, g_stop_flag);
    const bool ok = reader.run(&err);

    std::cout << "Read " << reader.frames() << " frames, skipped "
              << reader.skipped_bytes() << " bytes, "
              << sender->send_failures() << " failed sends\n";
    if (!ok) {
        std::cerr << "rePatcher connection lost: " << err << "\n";
        return 1;
    }
    return 0;
}
