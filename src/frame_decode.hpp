#pragma once
#include "event_sink.hpp"
#include "scaler.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace repatcher {

// ---------- Wire format ----------
constexpr uint8_t kFrameMarker = 0xC0;
constexpr size_t kFrameLen = 18;
constexpr size_t kNumKnobs = 6;
constexpr size_t kNumOutputs = 6;
constexpr size_t kPatchBayOffset = 12;

// Knob words are 0..1023 nominally; the device maps them onto 0.0..1.0.
constexpr double kKnobSrcBeg = 0.0;
constexpr double kKnobSrcEnd = 1024.0;
constexpr double kKnobDstBeg = 0.0;
constexpr double kKnobDstEnd = 1.0;

using RawFrame = std::array<uint8_t, kFrameLen>;

// ---------- Data model ----------
struct KnobReading {
    int knob = 0;
    double value = 0.0;
};

struct PatchBayReading {
    int output = 0;
    Connections connections{};
};

// Readings in emission order: knob5..knob0, then bay5..bay0.
struct DecodedFrame {
    std::array<KnobReading, kNumKnobs> knobs{};
    std::array<PatchBayReading, kNumOutputs> bays{};
};

// Scaler matching the device's knob range.
Scaler make_knob_scaler();

// Knob word from two 7-bit-clean bytes: (hi << 7) | lo. The reserved top bit
// of each byte is not masked.
uint32_t decode_knob_word(uint8_t lo, uint8_t hi);

// Unpack one patch bay row, bit 5 first.
Connections decode_patch_row(uint8_t row);

std::array<KnobReading, kNumKnobs> decode_knobs(const RawFrame& frame, const Scaler& scaler);
std::array<PatchBayReading, kNumOutputs> decode_patch_bay(const RawFrame& frame);

DecodedFrame decode_frame(const RawFrame& frame, const Scaler& scaler);

// Emit every reading of a decoded frame to the sink, knobs first.
// Returns the number of sink calls made.
size_t dispatch(const DecodedFrame& decoded, EventSink& sink);

} // namespace repatcher
