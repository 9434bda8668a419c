#include <hashcast/pipeline/verifier.h>
#include <algorithm>
#include <string>

namespace hashcast::pipeline {

    std::vector<Record> rechunk(std::span<const std::byte> buffer, std::size_t record_length) {
        if (record_length == 0 || buffer.empty() || buffer.size() % record_length != 0) {
            throw IntegrityFault("reconstructed " + std::to_string(buffer.size()) +
                " bytes do not split into " + std::to_string(record_length) + "-byte records");
        }

        std::vector<Record> out;
        out.reserve(buffer.size() / record_length);
        for (std::size_t off = 0; off < buffer.size(); off += record_length) {
            const auto chunk = buffer.subspan(off, record_length);
            out.emplace_back(chunk.begin(), chunk.end());
        }
        return out;
    }

    VerifyReport verify(std::span<const Record> expected, std::span<const std::byte> recovered, std::size_t record_length) {
        VerifyReport rep;
        rep.records = rechunk(recovered, record_length);
        rep.count_mismatch = rep.records.size() != expected.size();

        const std::size_t n = std::min(rep.records.size(), expected.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (rep.records[i] != expected[i]) rep.mismatched.push_back(i);
        }
        return rep;
    }

} // namespace hashcast::pipeline
