#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace repatcher {

// Minimal OSC 1.0 message: an address pattern plus int32/float32 arguments.
class OscMessage {
public:
    explicit OscMessage(std::string address);

    OscMessage& add_int(int32_t v);
    OscMessage& add_float(float v);

    const std::string& address() const { return address_; }
    // Type tag string, e.g. ",if".
    std::string type_tags() const;
    size_t arg_count() const { return tags_.size(); }

    // Wire bytes: padded address, padded type tags, big-endian arguments.
    std::vector<uint8_t> encode() const;

private:
    std::string address_;
    std::string tags_;
    std::vector<uint32_t> words_;
};

} // namespace repatcher
