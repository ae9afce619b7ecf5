#include <catch2/catch_all.hpp>

#include "src/frame_decode.hpp"
#include "src/scaler.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace repatcher;
using Catch::Approx;

namespace {

// Records every sink call as a short tag, e.g. "knob5" / "bay0".
struct RecordingSink : EventSink {
    std::vector<std::string> calls;
    std::vector<KnobReading> knobs;
    std::vector<PatchBayReading> bays;

    void send_knob(int knob, double value) override {
        calls.push_back("knob" + std::to_string(knob));
        knobs.push_back({knob, value});
    }
    void send_patch_bay(int output, const Connections& connections) override {
        calls.push_back("bay" + std::to_string(output));
        bays.push_back({output, connections});
    }
};

} // namespace

TEST_CASE("Scaler: knob range maps words onto 0..1") {
    const Scaler s = make_knob_scaler();
    CHECK(s(0.0) == 0.0);
    CHECK(s(1024.0) == 1.0);
    for (int w = 0; w <= 1024; w += 7) {
        CHECK(s(w) == Approx(w / 1024.0));
    }
}

TEST_CASE("Scaler: no clamping outside the source range") {
    const Scaler s(0.0, 1024.0, 0.0, 1.0);
    CHECK(s(2048.0) == Approx(2.0));
    CHECK(s(-512.0) == Approx(-0.5));

    const Scaler inv(10.0, 20.0, 100.0, 0.0);
    CHECK(inv(15.0) == Approx(50.0));
    CHECK(inv(25.0) == Approx(-50.0));
}

TEST_CASE("Scaler: degenerate range fails at construction") {
    auto zero_width = [] { return Scaler(5.0, 5.0, 0.0, 1.0); };
    auto flat_output = [] { return Scaler(0.0, 1.0, 3.0, 3.0); };
    CHECK_THROWS_AS(zero_width(), std::invalid_argument);
    CHECK_NOTHROW(flat_output()); // flat output is still well defined
}

TEST_CASE("decode_knob_word: high byte contributes above bit 7") {
    CHECK(decode_knob_word(0x00, 0x00) == 0u);
    CHECK(decode_knob_word(0x7F, 0x07) == 1023u);
    CHECK(decode_knob_word(0x00, 0x08) == 1024u);
    // reserved top bit is not masked off
    CHECK(decode_knob_word(0x80, 0x00) == 128u);
    CHECK(decode_knob_word(0x00, 0x7F) == 16256u);
}

TEST_CASE("decode_patch_row: bit 5 first") {
    CHECK(decode_patch_row(32) == Connections{true, false, false, false, false, false});
    CHECK(decode_patch_row(1)  == Connections{false, false, false, false, false, true});
    CHECK(decode_patch_row(63) == Connections{true, true, true, true, true, true});
    CHECK(decode_patch_row(0)  == Connections{});
    // bits 6 and 7 carry no input
    CHECK(decode_patch_row(0xC0) == Connections{});
    CHECK(decode_patch_row(0b010100) == Connections{false, true, false, true, false, false});
}

TEST_CASE("decode_knobs: byte pairs are reverse indexed") {
    RawFrame f{};
    f[0] = 0x00; f[1] = 0x08;   // pair 0 -> knob 5, word 1024
    f[10] = 0x00; f[11] = 0x04; // pair 5 -> knob 0, word 512

    const auto knobs = decode_knobs(f, make_knob_scaler());
    REQUIRE(knobs.size() == 6);
    CHECK(knobs[0].knob == 5);
    CHECK(knobs[0].value == Approx(1.0));
    CHECK(knobs[5].knob == 0);
    CHECK(knobs[5].value == Approx(0.5));
    for (size_t i = 1; i < 5; ++i) {
        CHECK(knobs[i].knob == static_cast<int>(5 - i));
        CHECK(knobs[i].value == 0.0);
    }
}

TEST_CASE("decode_patch_bay: rows are reverse indexed") {
    RawFrame f{};
    f[12] = 32;
    f[17] = 63;

    const auto bays = decode_patch_bay(f);
    CHECK(bays[0].output == 5);
    CHECK(bays[0].connections == Connections{true, false, false, false, false, false});
    CHECK(bays[5].output == 0);
    CHECK(bays[5].connections == Connections{true, true, true, true, true, true});
    CHECK(bays[2].output == 3);
    CHECK(bays[2].connections == Connections{});
}

TEST_CASE("decode_frame: same bytes, same readings") {
    RawFrame f{};
    for (size_t i = 0; i < f.size(); ++i) f[i] = static_cast<uint8_t>(i * 13 + 5);

    const Scaler s = make_knob_scaler();
    const DecodedFrame a = decode_frame(f, s);
    const DecodedFrame b = decode_frame(f, s);
    for (size_t i = 0; i < kNumKnobs; ++i) {
        CHECK(a.knobs[i].knob == b.knobs[i].knob);
        CHECK(a.knobs[i].value == b.knobs[i].value);
    }
    for (size_t i = 0; i < kNumOutputs; ++i) {
        CHECK(a.bays[i].output == b.bays[i].output);
        CHECK(a.bays[i].connections == b.bays[i].connections);
    }
}

TEST_CASE("dispatch: twelve calls, knobs then bays, highest id first") {
    RawFrame f{};
    f[0] = 0x00; f[1] = 0x08;  // knob5 = 1.0
    f[10] = 0x00; f[11] = 0x02; // knob0 = 0.25
    f[12] = 32;                 // bay5
    f[13] = 1;                  // bay4
    f[17] = 63;                 // bay0

    RecordingSink sink;
    const size_t n = dispatch(decode_frame(f, make_knob_scaler()), sink);
    REQUIRE(n == 12);

    const std::vector<std::string> expected = {
        "knob5", "knob4", "knob3", "knob2", "knob1", "knob0",
        "bay5", "bay4", "bay3", "bay2", "bay1", "bay0"
    };
    CHECK(sink.calls == expected);

    REQUIRE(sink.knobs.size() == 6);
    CHECK(sink.knobs.front().value == Approx(1.0));
    CHECK(sink.knobs.back().value == Approx(0.25));

    REQUIRE(sink.bays.size() == 6);
    CHECK(sink.bays[0].connections == Connections{true, false, false, false, false, false});
    CHECK(sink.bays[1].connections == Connections{false, false, false, false, false, true});
    CHECK(sink.bays[5].connections == Connections{true, true, true, true, true, true});
}
