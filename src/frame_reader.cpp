#include "frame_reader.hpp"

namespace repatcher {

FrameReader::FrameReader(ByteSource& source, EventSink& sink, const std::atomic<bool>& stop)
    : source_(source), sink_(sink), stop_(stop), scaler_(make_knob_scaler()) {}

bool FrameReader::read_frame(RawFrame& frame, std::string* err) {
    // 1) sync on marker
    uint8_t b = 0;
    for (;;) {
        if (!source_.read_exact(&b, 1, err)) return false;
        if (b == kFrameMarker) break;
        ++skipped_;
    }

    // 2) body; a marker value in here is indistinguishable from data
    if (!source_.read_exact(frame.data(), frame.size(), err)) return false;

    // 3) drop anything queued behind this frame so we never fall behind the device
    source_.discard_input();
    return true;
}

bool FrameReader::run(std::string* err) {
    RawFrame frame{};
    while (!stop_requested()) {
        std::string read_err;
        if (!read_frame(frame, &read_err)) {
            // a signal that raised the flag also interrupts the blocked read
            if (stop_requested()) return true;
            if (err) *err = read_err;
            return false;
        }
        dispatch(decode_frame(frame, scaler_), sink_);
        ++frames_;
    }
    return true;
}

} // namespace repatcher
