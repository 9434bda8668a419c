#pragma once
#include <cstddef>
#include <span>
#include <vector>
#include <hashcast/pipeline/errors.h>
#include <hashcast/pipeline/source_assembler.h>

namespace hashcast::pipeline {

    // Split a reconstructed buffer back into records.
    // Throws IntegrityFault unless buffer.size() is a positive multiple of record_length.
    std::vector<Record> rechunk(std::span<const std::byte> buffer, std::size_t record_length);

    struct VerifyReport {
        std::vector<Record> records;             // recovered, in order
        std::vector<std::size_t> mismatched;     // indices differing from the input
        bool count_mismatch{ false };            // recovered record count != input count

        bool ok() const noexcept { return !count_mismatch && mismatched.empty(); }
    };

    // Compare a reconstructed buffer with the records that went in. Throws IntegrityFault (see rechunk).
    VerifyReport verify(std::span<const Record> expected, std::span<const std::byte> recovered, std::size_t record_length);

} // namespace hashcast::pipeline
