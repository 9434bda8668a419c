#include <hashcast/util/hex.h>

namespace hashcast::util {

    namespace {

        constexpr char kDigits[] = "0123456789abcdef";

        int nibble(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

    } // namespace

    std::string to_hex(std::span<const std::byte> bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);
        for (std::byte b : bytes) {
            const auto v = std::to_integer<unsigned>(b);
            out.push_back(kDigits[v >> 4]);
            out.push_back(kDigits[v & 0x0Fu]);
        }
        return out;
    }

    std::optional<std::vector<std::byte>> from_hex(std::string_view text) {
        if (text.size() % 2 != 0) return std::nullopt;

        std::vector<std::byte> out(text.size() / 2);
        for (std::size_t i = 0; i < out.size(); ++i) {
            const int hi = nibble(text[2 * i]);
            const int lo = nibble(text[2 * i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out[i] = std::byte{ static_cast<unsigned char>((hi << 4) | lo) };
        }
        return out;
    }

} // namespace hashcast::util
