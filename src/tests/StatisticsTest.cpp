//
// Created by Malik T on 09/10/2025.
//

#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/Statistics.hpp"

using namespace bomb::core;

namespace
{
    // 3 players, two copies of 1, 2, 3; the owner holds [1, 2].
    // Both other hands read [{1,2,3}, {2,3}] after the local filters.
    auto MakeState() -> BeliefState
    {
        Config cfg{};
        cfg.distribution = {{1, 2}, {2, 2}, {3, 2}};
        cfg.n_players = 3;
        cfg.use_global_solver = false;
        std::vector<WireValue> const hand{1, 2};
        return BeliefState(cfg, 0, hand);
    }

    auto Set(BeliefState const& b, std::initializer_list<WireValue> vs) -> ValueSet
    {
        ValueSet s;
        for (WireValue const v : vs) s.Insert(*b.Domain().IndexOf(v));
        return s;
    }
} // anonymous namespace

TEST(Statistics, Starting_Grid)
{
    BeliefState const b = MakeState();
    for (PlyrIdxT p = 1; p < 3; ++p)
    {
        EXPECT_EQ(b.Candidates(p, 0), Set(b, {1, 2, 3}));
        EXPECT_EQ(b.Candidates(p, 1), Set(b, {2, 3}));
    }
}

TEST(Statistics, Entropy_Sums_Over_Slots)
{
    BeliefState const b = MakeState();
    EXPECT_DOUBLE_EQ(stats::PositionEntropy(Set(b, {1})), 0.0);
    EXPECT_DOUBLE_EQ(stats::PositionEntropy(Set(b, {2, 3})), 1.0);
    EXPECT_DOUBLE_EQ(stats::PositionEntropy(ValueSet{}), 0.0);

    EXPECT_DOUBLE_EQ(stats::PlayerEntropy(b, 0), 0.0);
    EXPECT_DOUBLE_EQ(stats::PlayerEntropy(b, 1), std::log2(3.0) + 1.0);
    EXPECT_DOUBLE_EQ(stats::SystemEntropy(b), 2.0 * std::log2(3.0) + 2.0);
}

TEST(Statistics, Player_And_System_Progress)
{
    BeliefState const b = MakeState();

    stats::PlayerStats const own = stats::PlayerStatistics(b, 0);
    EXPECT_EQ(own.certain_count, 2u);
    EXPECT_EQ(own.uncertain_count, 0u);
    EXPECT_DOUBLE_EQ(own.progress_percent, 100.0);
    EXPECT_DOUBLE_EQ(own.entropy_normalized, 0.0);

    stats::PlayerStats const other = stats::PlayerStatistics(b, 2);
    EXPECT_EQ(other.certain_count, 0u);
    EXPECT_EQ(other.uncertain_count, 2u);
    EXPECT_DOUBLE_EQ(other.avg_possibilities, 2.5);
    EXPECT_DOUBLE_EQ(other.progress_percent, 0.0);
    EXPECT_DOUBLE_EQ(other.entropy_normalized, (std::log2(3.0) + 1.0) / (2.0 * std::log2(3.0)));

    stats::SystemStats const sys = stats::SystemStatistics(b);
    EXPECT_EQ(sys.total_positions, 6u);
    EXPECT_EQ(sys.certain_positions, 2u);
    EXPECT_EQ(sys.fully_deduced_players, 1u);
    EXPECT_EQ(sys.players.size(), 3u);
    EXPECT_NEAR(sys.progress_percent, 100.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(sys.total_entropy, stats::SystemEntropy(b));
}

TEST(Statistics, Call_Suggestions_Use_Playable_Values)
{
    BeliefState const b = MakeState();
    EXPECT_EQ(stats::PlayableValues(b), Set(b, {1, 2}));

    stats::CallSuggestions const calls = stats::AllCallSuggestions(b);
    EXPECT_TRUE(calls.certain.empty());
    ASSERT_EQ(calls.uncertain.size(), 6u);

    // the two-way slots come first
    for (size_t i{}; i < 2; ++i)
    {
        EXPECT_EQ(calls.uncertain[i].slot, 1);
        EXPECT_EQ(calls.uncertain[i].value, *b.Domain().IndexOf(2));
        EXPECT_DOUBLE_EQ(calls.uncertain[i].probability, 0.5);
    }
    EXPECT_EQ(calls.uncertain[0].target, 1);
    EXPECT_EQ(calls.uncertain[1].target, 2);
    for (size_t i = 2; i < calls.uncertain.size(); ++i)
    {
        EXPECT_EQ(calls.uncertain[i].n_possible, 3);
        EXPECT_NE(calls.uncertain[i].value, *b.Domain().IndexOf(3));
    }
}

TEST(Statistics, Call_Suggestions_Report_Certain_Slots)
{
    BeliefState b = MakeState();
    ASSERT_TRUE(b.ProcessSignal({.player = 1, .value = 2, .position = 1}));

    // the signalled 2 exhausts the 2s, which settles every other slot
    ASSERT_TRUE(b.IsFullyDeduced(1));
    ASSERT_TRUE(b.IsFullyDeduced(2));

    stats::CallSuggestions const calls = stats::AllCallSuggestions(b);
    EXPECT_TRUE(calls.uncertain.empty());
    ASSERT_EQ(calls.certain.size(), 2u);
    EXPECT_EQ(calls.certain[0].target, 1);
    EXPECT_EQ(calls.certain[0].slot, 0);
    EXPECT_EQ(calls.certain[0].value, *b.Domain().IndexOf(1));
    EXPECT_EQ(calls.certain[1].slot, 1);
    EXPECT_EQ(calls.certain[1].value, *b.Domain().IndexOf(2));
    EXPECT_DOUBLE_EQ(calls.certain[1].probability, 1.0);
}

TEST(Statistics, Double_Chance_Counts_Whole_Hands)
{
    BeliefState const b = MakeState();
    // (1,2) (1,3) (2,2) (2,3) (3,3)
    std::vector<stats::DoubleChanceOption> const opts = stats::DoubleChanceSuggestions(b, 1'000'000);
    ASSERT_EQ(opts.size(), 4u);

    ValueIdxT const one = *b.Domain().IndexOf(1);
    ValueIdxT const two = *b.Domain().IndexOf(2);
    for (stats::DoubleChanceOption const& o : opts)
    {
        EXPECT_FALSE(o.approximate);
        EXPECT_FALSE(o.is_certain);
        EXPECT_EQ(o.slot1, 0);
        EXPECT_EQ(o.slot2, 1);
        if (o.value == two)
        {
            EXPECT_DOUBLE_EQ(o.probability, 0.6);
        }
        else
        {
            EXPECT_EQ(o.value, one);
            EXPECT_DOUBLE_EQ(o.probability, 0.4);
        }
    }
    EXPECT_EQ(opts.front().value, two);
    EXPECT_EQ(opts.back().value, one);
}

TEST(Statistics, Double_Chance_Falls_Back_To_Estimate)
{
    BeliefState const b = MakeState();
    std::vector<stats::DoubleChanceOption> const opts = stats::DoubleChanceSuggestions(b, 0);
    ASSERT_EQ(opts.size(), 4u);

    ValueIdxT const two = *b.Domain().IndexOf(2);
    for (stats::DoubleChanceOption const& o : opts)
    {
        EXPECT_TRUE(o.approximate);
        EXPECT_NEAR(o.probability, o.value == two ? 2.0 / 3.0 : 1.0 / 3.0, 1e-12);
    }
}
