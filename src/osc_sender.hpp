#pragma once
#include "event_sink.hpp"
#include "osc_message.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <sys/socket.h>

namespace repatcher {

// Address patterns the bridge publishes.
std::string knob_address(int knob);
std::string output_address(int output);

// Builds the OSC messages for one reading.
OscMessage make_knob_message(int knob, double value);
OscMessage make_patch_bay_message(int output, const Connections& connections);

// EventSink that publishes each reading as one OSC datagram. Fire and forget:
// a failed send is logged and dropped.
class OscSender : public EventSink {
public:
    // Resolves host (IPv4) and opens a UDP socket. Returns nullptr with the
    // cause in *err on failure.
    static std::unique_ptr<OscSender> open(const std::string& host, uint16_t port,
                                           bool verbose, std::string* err = nullptr);

    ~OscSender() override;
    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    void send_knob(int knob, double value) override;
    void send_patch_bay(int output, const Connections& connections) override;

    // Send one encoded message. Returns false if the datagram was not fully sent.
    bool send(const OscMessage& msg);

    uint64_t send_failures() const { return send_failures_; }

private:
    OscSender(int fd, const sockaddr_storage& dest, socklen_t dest_len, bool verbose);

    int fd_;
    sockaddr_storage dest_;
    socklen_t dest_len_;
    bool verbose_;
    uint64_t send_failures_ = 0;
};

} // namespace repatcher
