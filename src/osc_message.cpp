#include "osc_message.hpp"
#include <cstring>
#include <utility>

namespace repatcher {

// ------------------ helpers ------------------
// OSC strings carry at least one NUL and are padded to a 4-byte boundary.
static void put_padded_string(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
    size_t pad = 4 - (s.size() % 4);
    out.insert(out.end(), pad, 0);
}

static void put_be32(std::vector<uint8_t>& out, uint32_t w) {
    out.push_back(static_cast<uint8_t>((w >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((w >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((w >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(w & 0xFF));
}

// ------------------ OscMessage ------------------
OscMessage::OscMessage(std::string address) : address_(std::move(address)) {}

OscMessage& OscMessage::add_int(int32_t v) {
    tags_.push_back('i');
    words_.push_back(static_cast<uint32_t>(v));
    return *this;
}

OscMessage& OscMessage::add_float(float v) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32-bit");
    uint32_t w = 0;
    std::memcpy(&w, &v, sizeof(w));
    tags_.push_back('f');
    words_.push_back(w);
    return *this;
}

std::string OscMessage::type_tags() const {
    return "," + tags_;
}

std::vector<uint8_t> OscMessage::encode() const {
    std::vector<uint8_t> out;
    out.reserve(address_.size() + tags_.size() + 8 + 4 * words_.size());
    put_padded_string(out, address_);
    put_padded_string(out, type_tags());
    for (uint32_t w : words_) put_be32(out, w);
    return out;
}

} // namespace repatcher
