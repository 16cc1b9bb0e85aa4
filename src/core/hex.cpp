#include "paykit/core/hex.hpp"

namespace paykit::hex {

namespace {
    constexpr char kDigits[] = "0123456789abcdef";

    int NibbleValue(const char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }
}

std::string Encode(const std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> Decode(const std::string_view text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        const int hi = NibbleValue(text[i]);
        const int lo = NibbleValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string Abbreviate(const std::span<const uint8_t> bytes, const size_t prefix_bytes) {
    const size_t shown = bytes.size() < prefix_bytes ? bytes.size() : prefix_bytes;
    return Encode(bytes.first(shown)) + "...";
}

std::string Abbreviate(const std::string_view hex_text, const size_t prefix_chars) {
    if (hex_text.size() <= prefix_chars) {
        return std::string(hex_text);
    }
    return std::string(hex_text.substr(0, prefix_chars)) + "...";
}

}
