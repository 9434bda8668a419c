#include <hashcast/pipeline/source_assembler.h>
#include <hashcast/util/hex.h>

namespace hashcast::pipeline {

    std::vector<std::byte> assemble(std::span<const Record> records, std::size_t record_length) {
        if (record_length == 0) {
            throw MalformedRecord(0, 0, 0, "record length must be > 0");
        }
        if (records.empty()) {
            throw MalformedRecord(0, 0, record_length, "no records to assemble");
        }

        std::vector<std::byte> buf;
        buf.reserve(records.size() * record_length);
        for (std::size_t i = 0; i < records.size(); ++i) {
            const auto& r = records[i];
            if (r.size() != record_length) {
                throw MalformedRecord(i, r.size(), record_length,
                    "record " + std::to_string(i) + " is " + std::to_string(r.size()) +
                    " bytes, expected " + std::to_string(record_length));
            }
            buf.insert(buf.end(), r.begin(), r.end());
        }
        return buf;
    }

    std::vector<Record> parse_hex_records(std::span<const std::string> hex_records, std::size_t record_length) {
        std::vector<Record> out;
        out.reserve(hex_records.size());
        for (std::size_t i = 0; i < hex_records.size(); ++i) {
            auto bytes = util::from_hex(hex_records[i]);
            if (!bytes) {
                throw MalformedRecord(i, hex_records[i].size() / 2, record_length,
                    "record " + std::to_string(i) + " is not valid hex");
            }
            out.push_back(std::move(*bytes));
        }
        return out;
    }

    std::vector<std::byte> assemble_hex(std::span<const std::string> hex_records, std::size_t record_length) {
        const auto records = parse_hex_records(hex_records, record_length);
        return assemble(records, record_length);
    }

} // namespace hashcast::pipeline
