#include "osc_sender.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace repatcher {

std::string knob_address(int knob) {
    return "/repatcher/knob" + std::to_string(knob);
}

std::string output_address(int output) {
    return "/repatcher/output" + std::to_string(output);
}

OscMessage make_knob_message(int knob, double value) {
    OscMessage msg(knob_address(knob));
    msg.add_float(static_cast<float>(value));
    return msg;
}

OscMessage make_patch_bay_message(int output, const Connections& connections) {
    OscMessage msg(output_address(output));
    for (bool c : connections) msg.add_int(c ? 1 : 0);
    return msg;
}

// ------------------ OscSender ------------------
OscSender::OscSender(int fd, const sockaddr_storage& dest, socklen_t dest_len, bool verbose)
    : fd_(fd), dest_(dest), dest_len_(dest_len), verbose_(verbose) {}

OscSender::~OscSender() {
    if (fd_ >= 0) ::close(fd_);
}

std::unique_ptr<OscSender> OscSender::open(const std::string& host, uint16_t port,
                                           bool verbose, std::string* err) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        if (err) *err = "cannot resolve " + host + ": " + ::gai_strerror(rc);
        return nullptr;
    }

    sockaddr_storage dest{};
    std::memcpy(&dest, res->ai_addr, res->ai_addrlen);
    socklen_t dest_len = static_cast<socklen_t>(res->ai_addrlen);
    ::freeaddrinfo(res);

    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        if (err) *err = std::string("cannot create UDP socket: ") + std::strerror(errno);
        return nullptr;
    }
    return std::unique_ptr<OscSender>(new OscSender(fd, dest, dest_len, verbose));
}

bool OscSender::send(const OscMessage& msg) {
    const std::vector<uint8_t> bytes = msg.encode();
    ssize_t sent = ::sendto(fd_, bytes.data(), bytes.size(), 0,
                            reinterpret_cast<const sockaddr*>(&dest_), dest_len_);
    if (sent != static_cast<ssize_t>(bytes.size())) {
        ++send_failures_;
        std::cerr << "[OscSender] send " << msg.address() << " failed: "
                  << (sent < 0 ? std::strerror(errno) : "short write") << "\n";
        return false;
    }
    return true;
}

void OscSender::send_knob(int knob, double value) {
    if (verbose_) {
        std::cout << "knob " << knob << ": " << std::fixed << value << std::defaultfloat << "\n";
    }
    send(make_knob_message(knob, value));
}

void OscSender::send_patch_bay(int output, const Connections& connections) {
    if (verbose_) {
        std::cout << "bay " << output << ": [";
        for (size_t i = 0; i < connections.size(); ++i) {
            std::cout << (i ? ", " : "") << (connections[i] ? 1 : 0);
        }
        std::cout << "]\n";
    }
    send(make_patch_bay_message(output, connections));
}

} // namespace repatcher
