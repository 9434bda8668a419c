#include <boost/test/unit_test.hpp>  // not the included runner
#include <hashcast/protocol/packet_codec.h>
#include <hashcast/fec_core/encoder.h>
#include <hashcast/util/endian.h>
#include <vector>
#include <cstddef>

using namespace hashcast::protocol;
using namespace hashcast::fec_core;

namespace {
    EncodingPacket sample_packet() {
        std::vector<std::byte> d(5);
        for (std::size_t i = 0; i < d.size(); ++i) d[i] = std::byte{ static_cast<unsigned char>(0xA0 + i) };
        return EncodingPacket(PayloadId{ 2, 0x010203u }, std::move(d));
    }
} // namespace

BOOST_AUTO_TEST_SUITE(packet_codec_suite)

BOOST_AUTO_TEST_CASE(packet_layout_is_stable) {
    const auto wire = encode_packet(sample_packet());
    BOOST_REQUIRE_EQUAL(wire.size(), 8u + 5u + 4u);

    const std::span<const std::byte> s(wire.data(), wire.size());
    BOOST_TEST(std::to_integer<unsigned>(s[0]) == k_wire_version);
    BOOST_TEST(std::to_integer<unsigned>(s[1]) == 2u);
    BOOST_TEST(hashcast::util::endian::read_u16_le(s.subspan(2, 2)) == 5u);
    BOOST_TEST(hashcast::util::endian::read_u32_le(s.subspan(4, 4)) == 0x010203u);
    BOOST_TEST(std::to_integer<unsigned>(s[8]) == 0xA0u);

    const auto back = decode_packet(s);
    BOOST_REQUIRE(back.has_value());
    BOOST_TEST((*back == sample_packet()));
}

BOOST_AUTO_TEST_CASE(corruption_is_detected) {
    auto wire = encode_packet(sample_packet());
    wire[9] ^= std::byte{ 0x40 }; // payload bit flip -> CRC mismatch
    BOOST_TEST(!decode_packet(wire).has_value());

    auto wire2 = encode_packet(sample_packet());
    wire2[0] = std::byte{ 9 }; // unknown version
    BOOST_TEST(!decode_packet(wire2).has_value());

    auto wire3 = encode_packet(sample_packet());
    wire3.resize(wire3.size() - 1); // truncated
    BOOST_TEST(!decode_packet(wire3).has_value());
}

BOOST_AUTO_TEST_CASE(config_travels_out_of_band) {
    std::vector<std::byte> data(1000, std::byte{ 0x5A });
    const Encoder enc(data, 8, 32);

    const auto wire = encode_config(enc.config());
    BOOST_REQUIRE_EQUAL(wire.size(), 16u);
    const auto back = decode_config(wire);
    BOOST_REQUIRE(back.has_value());
    BOOST_TEST((*back == enc.config()));

    auto bad = wire;
    bad[1] = std::byte{ 7 }; // block count inconsistent with F/T/max
    BOOST_TEST(!decode_config(bad).has_value());
    BOOST_TEST(!decode_config(std::span<const std::byte>(wire.data(), 15)).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
