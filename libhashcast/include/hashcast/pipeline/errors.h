#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hashcast::pipeline {

    // An input record has a bad encoding or length. Thrown at assembly time.
    class MalformedRecord : public std::runtime_error {
    public:
        MalformedRecord(std::size_t index, std::size_t length, std::size_t expected, const std::string& what)
            : std::runtime_error(what), index_(index), length_(length), expected_(expected) {
        }

        std::size_t index() const noexcept { return index_; }
        std::size_t length() const noexcept { return length_; }
        std::size_t expected_length() const noexcept { return expected_; }

    private:
        std::size_t index_;
        std::size_t length_;
        std::size_t expected_;
    };

    // A "reconstructed" buffer does not fit the record layout: the transform broke its contract.
    class IntegrityFault : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Terminal result of one pipeline run.
    enum class outcome : std::uint8_t {
        recovered,
        insufficient_redundancy,
        integrity_fault,
    };

    inline std::string_view to_string(outcome o) noexcept {
        switch (o) {
        case outcome::recovered: return "recovered";
        case outcome::insufficient_redundancy: return "insufficient_redundancy";
        case outcome::integrity_fault: return "integrity_fault";
        }
        return "unknown";
    }

} // namespace hashcast::pipeline
