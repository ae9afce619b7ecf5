#include "frame_decode.hpp"

namespace repatcher {

// ------------------ helpers ------------------
static const std::array<uint8_t, 6> kRowMasks = {32, 16, 8, 4, 2, 1};

static inline bool bit_set(uint8_t value, uint8_t mask) {
    return (value & mask) == mask;
}

// ------------------ decoding ------------------
Scaler make_knob_scaler() {
    return Scaler(kKnobSrcBeg, kKnobSrcEnd, kKnobDstBeg, kKnobDstEnd);
}

uint32_t decode_knob_word(uint8_t lo, uint8_t hi) {
    return (static_cast<uint32_t>(hi) << 7) | static_cast<uint32_t>(lo);
}

Connections decode_patch_row(uint8_t row) {
    Connections c{};
    for (size_t k = 0; k < kRowMasks.size(); ++k) {
        c[k] = bit_set(row, kRowMasks[k]);
    }
    return c;
}

std::array<KnobReading, kNumKnobs> decode_knobs(const RawFrame& frame, const Scaler& scaler) {
    std::array<KnobReading, kNumKnobs> out{};
    for (size_t i = 0; i < 2 * kNumKnobs; i += 2) {
        // knobs arrive in reverse order
        KnobReading& r = out[i / 2];
        r.knob = static_cast<int>(kNumKnobs - 1 - i / 2);
        r.value = scaler(static_cast<double>(decode_knob_word(frame[i], frame[i + 1])));
    }
    return out;
}

std::array<PatchBayReading, kNumOutputs> decode_patch_bay(const RawFrame& frame) {
    std::array<PatchBayReading, kNumOutputs> out{};
    for (size_t i = kPatchBayOffset; i < kFrameLen; ++i) {
        // so do the outputs
        PatchBayReading& r = out[i - kPatchBayOffset];
        r.output = static_cast<int>(kNumOutputs - 1 - (i - kPatchBayOffset));
        r.connections = decode_patch_row(frame[i]);
    }
    return out;
}

DecodedFrame decode_frame(const RawFrame& frame, const Scaler& scaler) {
    DecodedFrame d;
    d.knobs = decode_knobs(frame, scaler);
    d.bays = decode_patch_bay(frame);
    return d;
}

size_t dispatch(const DecodedFrame& decoded, EventSink& sink) {
    size_t count = 0;
    for (const auto& k : decoded.knobs) {
        sink.send_knob(k.knob, k.value);
        ++count;
    }
    for (const auto& b : decoded.bays) {
        sink.send_patch_bay(b.output, b.connections);
        ++count;
    }
    return count;
}

} // namespace repatcher
