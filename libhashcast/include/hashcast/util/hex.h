#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hashcast::util {

    // Lowercase hex rendering of a byte span.
    std::string to_hex(std::span<const std::byte> bytes);

    // Parse hex text (either case). Returns nullopt on odd length or a non-hex character.
    std::optional<std::vector<std::byte>> from_hex(std::string_view text);

} // namespace hashcast::util
