#include <boost/test/unit_test.hpp>  // not the included runner
#include <hashcast/util/hex.h>
#include <hashcast/util/uuid.h>
#include <string>

using namespace hashcast::util;

BOOST_AUTO_TEST_SUITE(hex_suite)

BOOST_AUTO_TEST_CASE(parse_and_print) {
    const auto b = from_hex("00FFa1");
    BOOST_REQUIRE(b.has_value());
    BOOST_REQUIRE_EQUAL(b->size(), 3u);
    BOOST_TEST(std::to_integer<unsigned>((*b)[1]) == 0xFFu);
    BOOST_TEST(to_hex(*b) == "00ffa1");
}

BOOST_AUTO_TEST_CASE(rejects_bad_input) {
    BOOST_TEST(!from_hex("abc").has_value());   // odd length
    BOOST_TEST(!from_hex("zz").has_value());    // not hex
    BOOST_TEST(!from_hex("0x12").has_value());  // prefix not accepted
    BOOST_TEST(from_hex("")->empty());
}

BOOST_AUTO_TEST_CASE(uuid_shape) {
    const auto id = uuid_v4();
    BOOST_REQUIRE_EQUAL(id.size(), 36u);
    BOOST_TEST(id[8] == '-');
    BOOST_TEST(id[13] == '-');
    BOOST_TEST(id[14] == '4'); // version nibble
    BOOST_TEST(id[23] == '-');
}

BOOST_AUTO_TEST_SUITE_END()
