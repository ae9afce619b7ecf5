#pragma once
#include <array>

namespace repatcher {

// One flag per patch bay input, ordered by mask 32,16,8,4,2,1.
using Connections = std::array<bool, 6>;

// Destination for decoded readings. Called synchronously from the reader
// loop, so a slow sink stalls frame intake.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void send_knob(int knob, double value) = 0;
    virtual void send_patch_bay(int output, const Connections& connections) = 0;
};

} // namespace repatcher
