#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <vector>
#include <hashcast/pipeline/errors.h>

namespace hashcast::pipeline {

    using Record = std::vector<std::byte>;

    // Sample domain: 32-byte hash digests.
    inline constexpr std::size_t k_default_record_length = 32;

    // Concatenate records in input order; record i occupies [i*L, (i+1)*L).
    // Throws MalformedRecord on an empty list, L == 0 or any record whose length != L.
    std::vector<std::byte> assemble(std::span<const Record> records, std::size_t record_length);

    // Parse each record from hex, then assemble. A parse failure is a MalformedRecord.
    std::vector<std::byte> assemble_hex(std::span<const std::string> hex_records, std::size_t record_length);

    // Hex parse without assembling (used to keep the parsed records for verification).
    std::vector<Record> parse_hex_records(std::span<const std::string> hex_records, std::size_t record_length);

} // namespace hashcast::pipeline
