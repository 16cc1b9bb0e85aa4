#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace paykit::hex {

[[nodiscard]] std::string Encode(std::span<const uint8_t> bytes);

/// Accepts upper or lower case digits. Returns nullopt on odd length or a
/// non-hex character.
[[nodiscard]] std::optional<std::vector<uint8_t>> Decode(std::string_view text);

/// Leading hex digits followed by an ellipsis, for log lines.
[[nodiscard]] std::string Abbreviate(std::span<const uint8_t> bytes, size_t prefix_bytes = 4);
[[nodiscard]] std::string Abbreviate(std::string_view hex_text, size_t prefix_chars = 8);

}
