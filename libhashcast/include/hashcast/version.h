#pragma once
#include <string>
#include <string_view>
#include <hashcast/protocol/wire.h>

namespace hashcast {

    inline constexpr int k_version_major = 0;
    inline constexpr int k_version_minor = 2;
    inline constexpr int k_version_patch = 0;

    inline constexpr std::string_view k_version_str = "0.2.0";

    inline const char* version() noexcept {
        return k_version_str.data();
    }

    // "0.2.0 (wire v1)": printed by the apps next to their name.
    inline std::string version_banner() {
        return std::string(k_version_str) + " (wire v" + std::to_string(protocol::k_wire_version) + ")";
    }

} // namespace hashcast
