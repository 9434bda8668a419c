#include <boost/test/unit_test.hpp>  // not the included runner
#include <hashcast/sim/channel_factory.h>
#include <hashcast/sim/loss.h>
#include <hashcast/sim/rng.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace hashcast::sim;
using hashcast::fec_core::EncodingPacket;
using hashcast::fec_core::PayloadId;

namespace {
    // N packets whose ESI equals their stream index.
    PacketStream make_stream(std::uint32_t n) {
        PacketStream s;
        for (std::uint32_t i = 0; i < n; ++i) {
            s.emplace_back(PayloadId{ 0, i }, std::vector<std::byte>(4, std::byte{ static_cast<unsigned char>(i) }));
        }
        return s;
    }

    std::vector<std::uint32_t> esis(const PacketStream& s) {
        std::vector<std::uint32_t> out;
        for (const auto& p : s) out.push_back(p.payload_id().encoding_symbol_id);
        return out;
    }

    // Every survivor is an unmodified member of the original stream, no duplicates.
    bool is_subset(const PacketStream& survivors, const PacketStream& original) {
        auto ids = esis(survivors);
        std::sort(ids.begin(), ids.end());
        if (std::adjacent_find(ids.begin(), ids.end()) != ids.end()) return false;
        for (const auto& p : survivors) {
            const auto id = p.payload_id().encoding_symbol_id;
            if (id >= original.size() || !(p == original[id])) return false;
        }
        return true;
    }
} // namespace

BOOST_AUTO_TEST_SUITE(sim_suite)

BOOST_AUTO_TEST_CASE(shuffle_truncate_counts) {
    const auto original = make_stream(19);

    ShuffleTruncateLoss loss8(8, 123u);
    const auto s = loss8.transmit(original);
    BOOST_TEST(s.size() == 11u);
    BOOST_TEST(is_subset(s, original));

    ShuffleTruncateLoss loss_all(19, 5u);
    BOOST_TEST(loss_all.transmit(original).empty());

    ShuffleTruncateLoss loss_more(100, 5u);
    BOOST_TEST(loss_more.transmit(original).empty());

    ShuffleTruncateLoss none(0, 5u);
    BOOST_TEST(none.transmit(original).size() == 19u);
}

BOOST_AUTO_TEST_CASE(shuffle_is_roughly_uniform) {
    // Each packet should be dropped about loss/N of the time.
    const std::uint32_t N = 10;
    const auto original = make_stream(N);
    std::vector<int> dropped(N, 0);

    ShuffleTruncateLoss loss(3, 42u);
    const int trials = 3000;
    for (int t = 0; t < trials; ++t) {
        const auto s = loss.transmit(original);
        std::vector<bool> seen(N, false);
        for (auto id : esis(s)) seen[id] = true;
        for (std::uint32_t i = 0; i < N; ++i) if (!seen[i]) ++dropped[i];
    }
    // Expected 900 drops per packet; allow a wide band.
    for (int d : dropped) {
        BOOST_TEST(d > 750);
        BOOST_TEST(d < 1050);
    }
}

BOOST_AUTO_TEST_CASE(index_drop_is_deterministic) {
    const auto original = make_stream(12);
    IndexDropLoss loss(std::vector<std::size_t>{ 9, 2, 5, 40 });
    const auto s = loss.transmit(original);
    BOOST_TEST(esis(s) == (std::vector<std::uint32_t>{ 0, 1, 3, 4, 6, 7, 8, 10, 11 }), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(burst_drop_clamps) {
    const auto original = make_stream(6);
    BurstLoss mid(2, 3);
    BOOST_TEST(esis(mid.transmit(original)) == (std::vector<std::uint32_t>{ 0, 1, 5 }), boost::test_tools::per_element());

    BurstLoss tail(4, 100);
    BOOST_TEST(tail.transmit(original).size() == 4u);
}

BOOST_AUTO_TEST_CASE(bernoulli_edges) {
    const auto original = make_stream(50);
    BernoulliLoss b0(0.0, 123u);
    BOOST_TEST(b0.transmit(original).size() == 50u);
    BernoulliLoss b1(1.0, 123u);
    BOOST_TEST(b1.transmit(original).empty());

    BernoulliLoss half(0.5, 7u);
    const auto s = half.transmit(original);
    BOOST_TEST(is_subset(s, original));
}

BOOST_AUTO_TEST_CASE(gilbert_toggle_alternating) {
    // Always transition and always drop in Bad: T, F, T, F, ...
    GilbertElliottLoss ge({ 1.0, 1.0, 1.0 }, 42u);
    for (int i = 0; i < 6; ++i) {
        BOOST_TEST(ge.drop() == (i % 2 == 0));
    }
}

BOOST_AUTO_TEST_CASE(reordering_keeps_survivor_set) {
    const auto original = make_stream(20);
    ReorderingChannel ch(std::make_unique<IndexDropLoss>(std::vector<std::size_t>{ 0, 19 }), 77u);
    const auto s = ch.transmit(original);
    BOOST_TEST(s.size() == 18u);
    BOOST_TEST(is_subset(s, original));
    auto ids = esis(s);
    std::sort(ids.begin(), ids.end());
    BOOST_TEST(ids.front() == 1u);
    BOOST_TEST(ids.back() == 18u);
}

BOOST_AUTO_TEST_CASE(shuffle_truncate_keeps_payloads_intact) {
    // Packets of varying payload size survive truncation byte for byte.
    PacketStream original;
    for (std::uint32_t i = 0; i < 30; ++i) {
        original.emplace_back(PayloadId{ 0, i }, std::vector<std::byte>(1 + i, std::byte{ 0xA5 }));
    }
    ShuffleTruncateLoss loss(7, 9u);
    for (int t = 0; t < 10; ++t) {
        const auto s = loss.transmit(original);
        BOOST_REQUIRE_EQUAL(s.size(), 23u);
        BOOST_TEST(is_subset(s, original));
        for (const auto& p : s) {
            BOOST_TEST(p.data().size() == p.payload_id().encoding_symbol_id + 1u);
        }
    }
}

BOOST_AUTO_TEST_CASE(channel_kinds_parse) {
    BOOST_TEST((parse_channel_kind("shuffle") == channel_kind::shuffle));
    BOOST_TEST((parse_channel_kind("burst") == channel_kind::burst));
    BOOST_TEST((parse_channel_kind("bernoulli") == channel_kind::bernoulli));
    BOOST_TEST((parse_channel_kind("gilbert") == channel_kind::gilbert));
    BOOST_TEST(!parse_channel_kind("Shuffle").has_value());
    BOOST_TEST(!parse_channel_kind("").has_value());

    BOOST_TEST(uses_loss_count(channel_kind::shuffle));
    BOOST_TEST(uses_loss_count(channel_kind::burst));
    BOOST_TEST(!uses_loss_count(channel_kind::bernoulli));
    BOOST_TEST(!uses_loss_count(channel_kind::gilbert));
}

BOOST_AUTO_TEST_CASE(channel_description_names_the_active_knobs) {
    ChannelOptions opt;
    opt.loss_count = 8;
    opt.p_loss = 0.25;

    opt.kind = channel_kind::shuffle;
    const auto shuffle = make_channel(opt)->describe();
    BOOST_TEST(shuffle.find("loss=8") != std::string::npos);

    opt.kind = channel_kind::bernoulli;
    const auto bernoulli = make_channel(opt)->describe();
    BOOST_TEST(bernoulli.find("p_loss=0.25") != std::string::npos);
    BOOST_TEST(bernoulli.find("loss=8") == std::string::npos);

    opt.kind = channel_kind::gilbert;
    const auto gilbert = make_channel(opt)->describe();
    BOOST_TEST(gilbert.find("p_g_to_b=0.25") != std::string::npos);
    BOOST_TEST(gilbert.find("loss=8") == std::string::npos);

    opt.kind = channel_kind::burst;
    opt.burst_start = 3;
    BOOST_TEST(make_channel(opt)->describe().find("start=3 length=8") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(probabilistic_channels_ignore_loss_count) {
    const auto original = make_stream(200);
    ChannelOptions opt;
    opt.kind = channel_kind::bernoulli;
    opt.p_loss = 0.0;
    opt.loss_count = 150;
    opt.seed = 4u;
    BOOST_TEST(make_channel(opt)->transmit(original).size() == 200u);
}

BOOST_AUTO_TEST_SUITE_END()
