#pragma once
#include "event_sink.hpp"
#include "frame_decode.hpp"
#include "scaler.hpp"
#include "serial_port.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace repatcher {

// Synchronises on the marker byte, pulls 18-byte frames off the source and
// pushes the decoded readings into the sink. Single threaded; all blocking
// happens inside ByteSource::read_exact.
class FrameReader {
public:
    FrameReader(ByteSource& source, EventSink& sink, const std::atomic<bool>& stop);

    // Seek to the next marker and read the frame body that follows it.
    // Drains the source's receive queue once the body is in.
    bool read_frame(RawFrame& frame, std::string* err = nullptr);

    // Read, decode and dispatch until the stop flag is raised (returns true)
    // or the source fails (returns false, cause in *err). The flag is checked
    // between frames, so stopping takes at most one more frame.
    bool run(std::string* err = nullptr);

    uint64_t frames() const { return frames_; }
    uint64_t skipped_bytes() const { return skipped_; }

private:
    bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

    ByteSource& source_;
    EventSink& sink_;
    const std::atomic<bool>& stop_;
    Scaler scaler_;
    uint64_t frames_ = 0;
    uint64_t skipped_ = 0;
};

} // namespace repatcher
