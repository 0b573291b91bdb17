//
// Created by Malik T on 05/10/2025.
//

#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/GlobalSolver.hpp"
#include "../debug/Invariants.hpp"

using namespace bomb::core;

namespace
{
    auto MakeConfig(std::vector<WireCount> dist, uint32_t n_players) -> Config
    {
        Config cfg{};
        cfg.distribution = std::move(dist);
        cfg.n_players = n_players;
        cfg.use_global_solver = false;
        return cfg;
    }

    // `copies` of every integer value in [1, max_value]
    auto Uniform(int max_value, uint8_t copies) -> std::vector<WireCount>
    {
        std::vector<WireCount> d;
        for (int v = 1; v <= max_value; ++v) d.push_back({static_cast<WireValue>(v), copies});
        return d;
    }

    auto Rank(BeliefState const& b, WireValue v) -> ValueIdxT
    {
        return *b.Domain().IndexOf(v);
    }

    auto Only(BeliefState const& b, WireValue v) -> ValueSet
    {
        return ValueSet::Single(Rank(b, v));
    }
} // anonymous namespace

TEST(LocalFilters, Existence_Threshold_Forces_Complement)
{
    std::vector<WireValue> const hand{1, 3, 5};
    BeliefState b(MakeConfig(Uniform(6, 1), 2), 0, hand);

    ASSERT_TRUE(b.IsConsistent());
    EXPECT_TRUE(b.IsFullyDeduced(1));
    EXPECT_EQ(b.Candidates(1, 0), Only(b, 2));
    EXPECT_EQ(b.Candidates(1, 1), Only(b, 4));
    EXPECT_EQ(b.Candidates(1, 2), Only(b, 6));
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(LocalFilters, Ordering_And_Distance_Around_A_Signal)
{
    std::vector<WireValue> const hand{1, 2, 3, 4};
    BeliefState b(MakeConfig(Uniform(8, 2), 4), 0, hand);

    ASSERT_TRUE(b.ProcessSignal({.player = 1, .value = 5, .position = 1}));
    ASSERT_TRUE(b.IsConsistent());

    ValueIdxT const five = Rank(b, 5);
    EXPECT_EQ(b.Candidates(1, 1), ValueSet::Single(five));
    EXPECT_TRUE(b.Tracker(five).IsCertain({1, 1}));
    EXPECT_TRUE(b.Candidates(1, 0).IsSubsetOf(ValueSet::UpTo(five)));
    EXPECT_TRUE(b.Candidates(1, 2).IsSubsetOf(ValueSet::From(five)));
    EXPECT_TRUE(b.Candidates(1, 3).IsSubsetOf(ValueSet::From(five)));
    // one more 5 at most, so it sits next to the signalled one
    EXPECT_FALSE(b.Candidates(1, 3).Contains(five));
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(LocalFilters, Revealed_Hand_Exhausts_Low_Values)
{
    std::vector<WireCount> const dist{{1, 2}, {2, 1}, {3, 1}, {4, 1}, {5, 2}, {6, 1},
                                      {7, 4}, {8, 4}, {9, 4}, {10, 4}};
    std::vector<WireValue> const hand{7, 7, 8, 8, 9, 9, 10, 10};
    BeliefState b(MakeConfig(dist, 3), 2, hand);

    ASSERT_TRUE(b.ProcessDoubleReveal({.player = 0, .value = 1, .position1 = 0, .position2 = 1}));
    ASSERT_TRUE(b.ProcessSignal({.player = 0, .value = 2, .position = 2}));
    ASSERT_TRUE(b.ProcessSignal({.player = 0, .value = 3, .position = 3}));
    ASSERT_TRUE(b.ProcessSignal({.player = 0, .value = 4, .position = 4}));
    ASSERT_TRUE(b.ProcessDoubleReveal({.player = 0, .value = 5, .position1 = 5, .position2 = 6}));
    ASSERT_TRUE(b.ProcessSignal({.player = 0, .value = 6, .position = 7}));
    ASSERT_TRUE(b.IsConsistent());

    for (WireValue const v : {1, 2, 3, 4, 5, 6})
    {
        EXPECT_TRUE(b.Tracker(Rank(b, v)).IsFullyAccounted()) << "value " << v;
        for (SlotIdxT s{}; s < b.HandSize(); ++s)
            EXPECT_FALSE(b.Candidates(1, s).Contains(Rank(b, v))) << "P1[" << int(s) << "] value " << v;
    }

    std::vector<WireValue> const expected{7, 7, 8, 8, 9, 9, 10, 10};
    for (SlotIdxT s{}; s < b.HandSize(); ++s)
        EXPECT_EQ(b.Candidates(1, s), Only(b, expected[s])) << "P1[" << int(s) << "]";
    EXPECT_TRUE(b.IsFullyDeduced(0));
    EXPECT_TRUE(b.IsFullyDeduced(1));
    EXPECT_TRUE(b.IsRevealed(0, 6));
    EXPECT_FALSE(b.IsRevealed(0, 7));
}

TEST(LocalFilters, Accounted_Value_Leaves_Other_Hands)
{
    std::vector<WireCount> const dist{{1, 4}, {2, 4}, {3, 3}, {4, 4}, {5, 1}};
    std::vector<std::vector<ValueIdxT>> const truth{{0, 0, 1, 1}, {0, 1, 2, 3}, {0, 1, 2, 2}, {3, 3, 3, 4}};

    for (bool const global : {false, true})
    {
        Config cfg = MakeConfig(dist, 4);
        cfg.use_global_solver = global;
        std::vector<WireValue> const hand{1, 1, 2, 2};
        BeliefState b(cfg, 0, hand, global ? std::make_shared<GlobalSolver>() : nullptr);

        ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 2, .value = 3, .success = true}));
        ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 0, .value = 3, .success = false}));
        ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 3, .value = 3, .success = true}));
        ASSERT_TRUE(b.IsConsistent()) << "global=" << global;

        ValueIdxT const three = Rank(b, 3);
        ValueTracker const& t = b.Tracker(three);
        EXPECT_EQ(t.Revealed().size(), 2u);
        EXPECT_TRUE(t.IsCalled(1));
        EXPECT_EQ(t.Uncertain(), 0);

        for (SlotIdxT s{}; s < b.HandSize(); ++s)
            EXPECT_FALSE(b.Candidates(3, s).Contains(three)) << "P3[" << int(s) << "] global=" << global;
        EXPECT_FALSE(b.Candidates(2, 0).Contains(three));
        EXPECT_FALSE(b.Candidates(2, 1).Contains(three));
        EXPECT_NO_THROW(debug::CheckInvariants(b, truth));
    }
}

TEST(LocalFilters, Hidden_Pair_Confines_Values)
{
    Config const cfg = MakeConfig(Uniform(6, 1), 3);
    ValueDomain const dom(cfg);
    auto const set = [&](std::initializer_list<WireValue> vs)
    {
        ValueSet s;
        for (WireValue const v : vs) s.Insert(*dom.IndexOf(v));
        return s;
    };

    BeliefGrid grid{
        {set({1}), set({6})},
        {set({2, 3}), set({2, 3, 4, 5})},
        {set({4, 5}), set({4, 5})},
    };
    std::vector<ValueTracker> trackers;
    for (ValueIdxT v{}; v < dom.Size(); ++v) trackers.emplace_back(v, dom.Copies(v));
    ASSERT_TRUE(trackers[*dom.IndexOf(1)].AddCertain({0, 0}));
    ASSERT_TRUE(trackers[*dom.IndexOf(6)].AddCertain({0, 1}));

    BeliefState b = BeliefState::Restore(cfg, 0, grid, trackers, {});
    ASSERT_TRUE(b.IsConsistent());
    EXPECT_EQ(b.OwnWire(1), *dom.IndexOf(6));

    EXPECT_TRUE(b.ApplyLocalFilters());
    ASSERT_TRUE(b.IsConsistent());
    // 2 and 3 have nowhere to go but P1
    EXPECT_EQ(b.Candidates(1, 0), set({2}));
    EXPECT_EQ(b.Candidates(1, 1), set({3}));
    EXPECT_EQ(b.Candidates(2, 0), set({4}));
    EXPECT_EQ(b.Candidates(2, 1), set({5}));
    EXPECT_NO_THROW(debug::CheckInvariants(b));

    // already at a fixed point
    EXPECT_FALSE(b.ApplyLocalFilters());
}

TEST(LocalFilters, Adjacent_Constraints_Propagate)
{
    std::vector<WireValue> const hand{1, 2, 3, 4};
    BeliefState b(MakeConfig(Uniform(4, 3), 3), 0, hand);

    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 1, .position1 = 0, .position2 = 1, .is_equal = true}));
    ASSERT_TRUE(b.ProcessSignal({.player = 1, .value = 2, .position = 0}));
    EXPECT_EQ(b.Candidates(1, 1), Only(b, 2));

    // positions may come in either order
    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 2, .position1 = 3, .position2 = 2, .is_equal = false}));
    ASSERT_TRUE(b.ProcessSignal({.player = 2, .value = 4, .position = 3}));
    EXPECT_FALSE(b.Candidates(2, 2).Contains(Rank(b, 4)));

    ASSERT_EQ(b.Constraints().adjacent.size(), 2u);
    EXPECT_EQ(b.Constraints().adjacent[0], (AdjacentConstraint{1, 0, true}));
    EXPECT_EQ(b.Constraints().adjacent[1], (AdjacentConstraint{2, 2, false}));
    EXPECT_TRUE(b.IsConsistent());
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(LocalFilters, CopyCount_Drops_Values_With_Too_Few_Copies)
{
    std::vector<WireCount> const dist{{1, 1}, {2, 2}, {3, 3}, {4, 3}, {5, 3}};
    std::vector<WireValue> const hand{3, 4, 5, 5};
    BeliefState b(MakeConfig(dist, 3), 0, hand);

    ValueIdxT const one = Rank(b, 1);
    ASSERT_TRUE(b.Candidates(1, 0).Contains(one));

    ASSERT_TRUE(b.ProcessCopyCountSignal({.player = 1, .position = 0, .copy_count = 2}));
    EXPECT_FALSE(b.Candidates(1, 0).Contains(one));
    EXPECT_TRUE(b.IsConsistent());

    // repeating the same signal adds nothing
    ASSERT_TRUE(b.ProcessCopyCountSignal({.player = 1, .position = 0, .copy_count = 2}));
    EXPECT_EQ(b.Constraints().copy_counts.size(), 1u);
    EXPECT_TRUE(b.IsConsistent());
}

TEST(LocalFilters, Conflicting_Signals_Flag_Contradiction)
{
    std::vector<WireValue> const hand{1, 2, 3, 4};
    BeliefState b(MakeConfig(Uniform(4, 3), 3), 0, hand);

    ASSERT_TRUE(b.ProcessCopyCountSignal({.player = 1, .position = 1, .copy_count = 1}));
    ASSERT_TRUE(b.IsConsistent());
    // the record itself is well formed, the history is not
    EXPECT_TRUE(b.ProcessCopyCountSignal({.player = 1, .position = 1, .copy_count = 2}));
    EXPECT_FALSE(b.IsConsistent());
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}
