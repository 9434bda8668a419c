#include <boost/test/unit_test.hpp>  // not the included runner
#include <hashcast/fec_core/encoder.h>
#include <hashcast/fec_core/decoder.h>
#include <hashcast/sim/rng.h>
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>
#include <cstddef>
#include <cstdint>

using namespace hashcast::fec_core;
using hashcast::sim::XorShift32;

namespace {
    std::vector<std::byte> random_bytes(std::size_t n, std::uint32_t seed) {
        XorShift32 rng(seed);
        std::vector<std::byte> v(n);
        for (auto& b : v) b = std::byte{ static_cast<unsigned char>(rng.next_u32() & 0xFF) };
        return v;
    }

    // Feed packets in order; return the first decoded result.
    std::optional<std::vector<std::byte>> feed_all(Decoder& dec, const std::vector<EncodingPacket>& pkts) {
        for (const auto& p : pkts) {
            if (auto out = dec.decode(p)) return out;
        }
        return std::nullopt;
    }
} // namespace

BOOST_AUTO_TEST_SUITE(encoder_decoder_suite)

BOOST_AUTO_TEST_CASE(stream_layout_block_major) {
    const auto data = random_bytes(100, 1u);
    const Encoder enc(data, 10, 4); // blocks of 4,3,3 symbols
    const auto pkts = enc.encoded_packets(2);

    BOOST_REQUIRE_EQUAL(pkts.size(), 10u + 2u * 3u);
    // Block 0: ESI 0..3 source, 4..5 repair; block 1 starts at index 6.
    BOOST_TEST(pkts[0].payload_id().source_block_number == 0u);
    BOOST_TEST(pkts[3].payload_id().encoding_symbol_id == 3u);
    BOOST_TEST(pkts[4].payload_id().encoding_symbol_id == 4u);
    BOOST_TEST(pkts[6].payload_id().source_block_number == 1u);
    BOOST_TEST(pkts[6].payload_id().encoding_symbol_id == 0u);
    for (const auto& p : pkts) BOOST_TEST(p.data().size() == 10u);

    // Source symbols carry the input verbatim.
    BOOST_TEST(std::equal(pkts[0].data().begin(), pkts[0].data().end(), data.begin()));
}

BOOST_AUTO_TEST_CASE(last_symbol_is_zero_padded) {
    const auto data = random_bytes(96, 2u);
    const Encoder enc(data, 128);
    const auto src = enc.source_packets(0);
    BOOST_REQUIRE_EQUAL(src.size(), 1u);
    BOOST_TEST(std::equal(data.begin(), data.end(), src[0].data().begin()));
    for (std::size_t i = 96; i < 128; ++i) BOOST_TEST(std::to_integer<unsigned>(src[0].data()[i]) == 0u);
}

BOOST_AUTO_TEST_CASE(repair_count_is_not_bounded_by_block_size) {
    const auto data = random_bytes(40, 3u);
    const Encoder enc(data, 10); // K = 4
    const auto repair = enc.repair_packets(0, 1000);
    BOOST_REQUIRE_EQUAL(repair.size(), 1000u);
    BOOST_TEST(repair.front().payload_id().encoding_symbol_id == 4u);
    BOOST_TEST(repair.back().payload_id().encoding_symbol_id == 1003u);
    BOOST_CHECK_THROW(enc.repair_packets(1, 1), std::invalid_argument);
    BOOST_CHECK_THROW(enc.source_packets(1), std::invalid_argument);

    // Repair symbols far past K still decode.
    Decoder dec(enc.config());
    const std::vector<EncodingPacket> tail(repair.end() - 8, repair.end());
    const auto out = feed_all(dec, tail);
    BOOST_REQUIRE(out.has_value());
    BOOST_TEST((*out == data));
}

BOOST_AUTO_TEST_CASE(repair_only_decode) {
    // No source symbol at all, a few spare repair symbols.
    const auto data = random_bytes(200, 4u);
    const Encoder enc(data, 16); // K = 13
    const auto repair = enc.repair_packets(0, 16);

    Decoder dec(enc.config());
    const auto out = feed_all(dec, repair);
    BOOST_REQUIRE(out.has_value());
    BOOST_TEST((*out == data));
    BOOST_TEST(dec.accepted_packets() >= 13u);
}

BOOST_AUTO_TEST_CASE(single_symbol_block_is_padded) {
    const auto data = random_bytes(32, 10u);
    const Encoder enc(data, 128); // K = 1, coded as 2 symbols
    const auto pkts = enc.encoded_packets(4);
    BOOST_REQUIRE_EQUAL(pkts.size(), 5u);
    BOOST_TEST(pkts[0].payload_id().encoding_symbol_id == 0u);
    // ESI 1 is the shared zero padding, never sent.
    BOOST_TEST(pkts[1].payload_id().encoding_symbol_id == 2u);

    // The source symbol alone completes the block.
    Decoder dec(enc.config());
    const auto out = dec.decode(pkts[0]);
    BOOST_REQUIRE(out.has_value());
    BOOST_TEST((*out == data));

    // Repair symbols alone do too.
    Decoder from_repair(enc.config());
    const std::vector<EncodingPacket> repair(pkts.begin() + 1, pkts.end());
    const auto again = feed_all(from_repair, repair);
    BOOST_REQUIRE(again.has_value());
    BOOST_TEST((*again == data));
}

BOOST_AUTO_TEST_CASE(transfer_beyond_255_symbols) {
    const auto data = random_bytes(1100 * 32, 11u);
    const Encoder enc(data, 1, 64000); // one block of 35200 one-byte symbols
    BOOST_REQUIRE_EQUAL(enc.config().source_blocks(), 1u);
    const auto pkts = enc.encoded_packets(0);
    BOOST_REQUIRE_EQUAL(pkts.size(), 35200u);

    Decoder dec(enc.config());
    const auto out = feed_all(dec, pkts);
    BOOST_REQUIRE(out.has_value());
    BOOST_TEST((*out == data));
}

BOOST_AUTO_TEST_CASE(fewer_than_k_never_decodes) {
    const auto data = random_bytes(200, 5u);
    const Encoder enc(data, 16);
    auto pkts = enc.encoded_packets(20);

    XorShift32 rng(99u);
    for (int trial = 0; trial < 20; ++trial) {
        std::shuffle(pkts.begin(), pkts.end(), rng);
        Decoder dec(enc.config());
        const std::vector<EncodingPacket> few(pkts.begin(), pkts.begin() + 12); // K - 1
        BOOST_TEST(!feed_all(dec, few).has_value());
        BOOST_TEST(!dec.complete());
    }
}

BOOST_AUTO_TEST_CASE(multi_block_random_subsets) {
    const auto data = random_bytes(1000, 6u);
    const Encoder enc(data, 8, 32); // Kt = 125 -> 4 blocks
    BOOST_REQUIRE_EQUAL(enc.config().source_blocks(), 4u);
    auto pkts = enc.encoded_packets(5);

    XorShift32 rng(7u);
    for (int trial = 0; trial < 10; ++trial) {
        std::shuffle(pkts.begin(), pkts.end(), rng);
        Decoder dec(enc.config());
        const auto out = feed_all(dec, pkts);
        BOOST_REQUIRE(out.has_value());
        BOOST_TEST((*out == data));
    }
}

BOOST_AUTO_TEST_CASE(duplicates_and_malformed_are_counted) {
    const auto data = random_bytes(64, 8u);
    const Encoder enc(data, 16); // K = 4
    const auto src = enc.source_packets(0);

    Decoder dec(enc.config());
    BOOST_TEST(!dec.decode(src[0]).has_value());
    BOOST_TEST(!dec.decode(src[0]).has_value());
    BOOST_TEST(!dec.decode(EncodingPacket(PayloadId{ 3, 0 }, std::vector<std::byte>(16))).has_value());
    BOOST_TEST(!dec.decode(EncodingPacket(PayloadId{ 0, 1 }, std::vector<std::byte>(5))).has_value());
    BOOST_TEST(!dec.decode(EncodingPacket(PayloadId{ 0, 300 }, std::vector<std::byte>(17))).has_value());

    BOOST_TEST(dec.accepted_packets() == 1u);
    BOOST_TEST(dec.duplicate_packets() == 1u);
    BOOST_TEST(dec.rejected_packets() == 3u);
}

BOOST_AUTO_TEST_CASE(decoded_data_is_sticky_and_checks_consistency) {
    const auto data = random_bytes(64, 9u);
    const Encoder enc(data, 16);
    const auto pkts = enc.encoded_packets(3);

    Decoder dec(enc.config());
    BOOST_CHECK_THROW(dec.is_consistent(pkts[0]), std::logic_error);
    for (std::size_t i = 0; i < 4; ++i) dec.decode(pkts[i]);
    BOOST_REQUIRE(dec.complete());

    // Later packets keep returning the same buffer.
    const auto again = dec.decode(pkts[5]);
    BOOST_REQUIRE(again.has_value());
    BOOST_TEST((*again == data));

    for (const auto& p : pkts) BOOST_TEST(dec.is_consistent(p));

    auto bytes = std::vector<std::byte>(pkts[5].data().begin(), pkts[5].data().end());
    bytes[0] ^= std::byte{ 0x01 };
    BOOST_TEST(!dec.is_consistent(EncodingPacket(pkts[5].payload_id(), bytes)));
}

BOOST_AUTO_TEST_SUITE_END()
