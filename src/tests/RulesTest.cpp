//
// Created by Malik T on 06/10/2025.
//

#include <gtest/gtest.h>
#include <optional>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/BombRules.hpp"
#include "../core/Exception.hpp"
#include "../debug/Invariants.hpp"

using namespace bomb::core;
using AVC = bomb::core::error::ActionViolationCode;

namespace
{
    // 3 players, values 1..4 with 3 copies each, owner P0 holds [1, 1, 2, 3]
    auto MakeConfig(bool irl = false) -> Config
    {
        Config cfg{};
        cfg.distribution = {{1, 3}, {2, 3}, {3, 3}, {4, 3}};
        cfg.n_players = 3;
        cfg.use_global_solver = false;
        cfg.playing_irl = irl;
        return cfg;
    }

    auto MakeState(bool irl = false) -> BeliefState
    {
        std::vector<WireValue> const hand{1, 1, 2, 3};
        return BeliefState(MakeConfig(irl), 0, hand);
    }

    auto Violation(error::ValidateResult const& r) -> std::optional<AVC>
    {
        if (r) return std::nullopt;
        return r.error().code;
    }

    auto Rank(BeliefState const& b, WireValue v) -> ValueIdxT
    {
        return *b.Domain().IndexOf(v);
    }
} // anonymous namespace

TEST(Rules, Rejected_Records_Leave_State_Untouched)
{
    BeliefState b = MakeState();
    BeliefGrid const before = b.Grid();

    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 1, .position = 0, .value = 2})), AVC::Call_SelfTarget);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 2, .position = 4, .value = 2})), AVC::PositionOutOfRange);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 3, .target = 2, .position = 0, .value = 2})), AVC::PlayerOutOfRange);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 2, .position = 0, .value = 7})), AVC::UnknownValue);
    EXPECT_EQ(Violation(b.ProcessSignal({.player = 1, .value = 2.5, .position = 0})), AVC::UnknownValue);
    EXPECT_EQ(Violation(b.ProcessDoubleReveal({.player = 1, .value = 2, .position1 = 1, .position2 = 1})),
              AVC::DoubleReveal_SamePosition);
    EXPECT_EQ(Violation(b.ProcessSwap({.player1 = 1, .player2 = 1})), AVC::Swap_SamePlayer);
    EXPECT_EQ(Violation(b.ProcessSwap({.player1 = 1, .player2 = 2, .final_pos1 = 5})),
              AVC::Swap_FinalPositionOutOfRange);
    EXPECT_EQ(Violation(b.ProcessCopyCountSignal({.player = 1, .position = 0, .copy_count = 0})),
              AVC::CopyCount_OutOfRange);
    EXPECT_EQ(Violation(b.ProcessCopyCountSignal({.player = 1, .position = 0, .copy_count = 5})),
              AVC::CopyCount_OutOfRange);
    EXPECT_EQ(Violation(b.ProcessAdjacentSignal({.player = 1, .position1 = 0, .position2 = 2})),
              AVC::Adjacent_NotAdjacent);
    EXPECT_EQ(Violation(b.ProcessHasValue({.player = 9, .value = 1})), AVC::PlayerOutOfRange);

    EXPECT_EQ(b.Grid(), before);
    EXPECT_TRUE(b.Constraints().Empty());
    EXPECT_TRUE(b.IsConsistent());
}

TEST(Rules, Own_Hand_Checks_Are_Strict)
{
    BeliefState b = MakeState();

    EXPECT_EQ(Violation(b.ProcessCall({.caller = 0, .target = 1, .position = 0, .value = 4})),
              AVC::Call_CallerLacksValue);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 0, .target = 1, .position = 0, .value = 2, .success = true,
                                       .caller_position = 0})),
              AVC::Call_CallerPositionMismatch);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 0, .position = 2, .value = 2, .success = false})),
              AVC::Call_OutcomeContradictsOwnHand);
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 0, .position = 2, .value = 3, .success = true})),
              AVC::Call_OutcomeContradictsOwnHand);
    EXPECT_EQ(Violation(b.ProcessSignal({.player = 0, .value = 4, .position = 3})), AVC::Signal_OwnHandMismatch);
    EXPECT_EQ(Violation(b.ProcessNotPresent({.player = 0, .value = 2})), AVC::NotPresent_OwnHandMismatch);
    EXPECT_EQ(Violation(b.ProcessHasValue({.player = 0, .value = 4})), AVC::HasValue_OwnHandMismatch);
    EXPECT_EQ(Violation(b.ProcessCopyCountSignal({.player = 0, .position = 0, .copy_count = 1})),
              AVC::CopyCount_OwnHandMismatch);
    EXPECT_EQ(Violation(b.ProcessAdjacentSignal({.player = 0, .position1 = 0, .position2 = 1, .is_equal = false})),
              AVC::Adjacent_OwnHandMismatch);
    EXPECT_EQ(Violation(b.ProcessSwap({.player1 = 0, .player2 = 1, .init_pos1 = 3, .init_pos2 = 3,
                                       .final_pos1 = 4, .final_pos2 = 2})),
              AVC::Swap_MissingReceivedValue);
    EXPECT_EQ(Violation(b.ProcessSwap({.player1 = 0, .player2 = 1, .init_pos1 = 3, .init_pos2 = 3,
                                       .final_pos1 = 4, .final_pos2 = 2, .received_value1 = 1})),
              AVC::Swap_OwnHandMismatch);

    // the accepted counterparts
    EXPECT_TRUE(b.ProcessCopyCountSignal({.player = 0, .position = 0, .copy_count = 2}));
    EXPECT_TRUE(b.ProcessAdjacentSignal({.player = 0, .position1 = 1, .position2 = 0, .is_equal = true}));
    EXPECT_TRUE(b.ProcessNotPresent({.player = 0, .value = 4}));
    EXPECT_TRUE(b.IsConsistent());
}

TEST(Rules, Informal_Play_Skips_Own_Hand_Checks)
{
    BeliefState b = MakeState(true);
    EXPECT_TRUE(b.ProcessCall({.caller = 0, .target = 1, .position = 3, .value = 4, .success = false}));
    EXPECT_TRUE(b.ProcessSwap({.player1 = 0, .player2 = 1, .init_pos1 = 0, .init_pos2 = 3,
                               .final_pos1 = 4, .final_pos2 = 0}));
    // the owner did not say what came in, but only a 3 fits after its own 3
    EXPECT_EQ(b.Candidates(0, 3), ValueSet::Single(Rank(b, 3)));
    EXPECT_EQ(b.OwnWire(3), Rank(b, 3));
    EXPECT_TRUE(b.IsConsistent());
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(Rules, Call_Outcomes_Update_Trackers)
{
    BeliefState b = MakeState();
    ValueIdxT const two = Rank(b, 2);
    ValueIdxT const three = Rank(b, 3);

    ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 1, .value = 2, .success = true}));
    EXPECT_EQ(b.Candidates(2, 1), ValueSet::Single(two));
    EXPECT_TRUE(b.Tracker(two).IsRevealed({2, 1}));
    EXPECT_TRUE(b.IsRevealed(2, 1));
    EXPECT_EQ(Violation(b.ProcessCall({.caller = 1, .target = 2, .position = 1, .value = 2, .success = true})),
              AVC::Call_TargetRevealed);

    ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 2, .value = 3, .success = false}));
    EXPECT_FALSE(b.Candidates(2, 2).Contains(three));
    EXPECT_TRUE(b.Tracker(three).IsCalled(1));

    // the owner's own reveal turns its certain slot into a revealed one
    ASSERT_TRUE(b.ProcessCall({.caller = 0, .target = 1, .position = 2, .value = 3, .success = true,
                               .caller_position = 3}));
    EXPECT_TRUE(b.Tracker(three).IsRevealed({0, 3}));
    EXPECT_FALSE(b.Tracker(three).IsCertain({0, 3}));
    // P1's revealed 3 is the copy its earlier call demonstrated
    EXPECT_TRUE(b.Tracker(three).IsRevealed({1, 2}));
    EXPECT_FALSE(b.Tracker(three).IsCalled(1));

    ASSERT_TRUE(b.ProcessHasValue({.player = 2, .value = 4}));
    EXPECT_TRUE(b.Tracker(Rank(b, 4)).IsCalled(2));

    ASSERT_TRUE(b.ProcessNotPresent({.player = 1, .value = 1}));
    for (SlotIdxT s{}; s < b.HandSize(); ++s)
        EXPECT_FALSE(b.Candidates(1, s).Contains(Rank(b, 1)));
    EXPECT_TRUE(b.IsConsistent());
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(Rules, HasValue_After_Reveal_Uses_Revealed_Copy)
{
    BeliefState b = MakeState();
    ValueIdxT const two = Rank(b, 2);

    // P1 shows its 2 while cutting P2's, leaving no unseen copy of 2
    ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 1, .value = 2, .success = true,
                               .caller_position = 0}));
    ASSERT_EQ(b.Tracker(two).Uncertain(), 0);

    ASSERT_TRUE(b.ProcessHasValue({.player = 1, .value = 2}));
    EXPECT_FALSE(b.Tracker(two).IsCalled(1));
    EXPECT_TRUE(b.Tracker(two).Called().empty());
    EXPECT_EQ(b.Tracker(two).Uncertain(), 0);
    EXPECT_TRUE(b.IsConsistent());

    // same for a failed call by a player whose copy is on the table
    ASSERT_TRUE(b.ProcessCall({.caller = 1, .target = 2, .position = 2, .value = 2, .success = false}));
    EXPECT_FALSE(b.Tracker(two).IsCalled(1));
    EXPECT_TRUE(b.IsConsistent());
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(Rules, Shifted_Positions)
{
    EXPECT_EQ(BombRules::EffectiveFinal(1, 4), 3);
    EXPECT_EQ(BombRules::EffectiveFinal(3, 1), 1);
    EXPECT_EQ(BombRules::EffectiveFinal(2, 2), 2);

    EXPECT_EQ(BombRules::ShiftedPosition(2, 2, 0), 0);
    EXPECT_EQ(BombRules::ShiftedPosition(0, 2, 1), 0);
    EXPECT_EQ(BombRules::ShiftedPosition(1, 2, 0), 2);
    EXPECT_EQ(BombRules::ShiftedPosition(3, 1, 3), 2);
    EXPECT_EQ(BombRules::ShiftedPosition(3, 1, 2), 3);
}

TEST(Rules, Swap_Moves_Wires_And_Trackers)
{
    BeliefState b = MakeState();
    ValueIdxT const three = Rank(b, 3);
    ValueIdxT const four = Rank(b, 4);

    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 1, .position1 = 0, .position2 = 1, .is_equal = true}));
    ASSERT_TRUE(b.ProcessCopyCountSignal({.player = 1, .position = 0, .copy_count = 2}));
    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 2, .position1 = 2, .position2 = 3, .is_equal = false}));
    ASSERT_TRUE(b.IsConsistent());

    // owner hands its 3 to P1 and takes a 4, which lands at the end
    ASSERT_TRUE(b.ProcessSwap({.player1 = 0, .player2 = 1, .init_pos1 = 3, .init_pos2 = 3,
                               .final_pos1 = 4, .final_pos2 = 2, .received_value1 = 4}));
    ASSERT_TRUE(b.IsConsistent());

    EXPECT_EQ(b.OwnWire(3), four);
    EXPECT_EQ(b.Candidates(0, 3), ValueSet::Single(four));
    EXPECT_TRUE(b.Tracker(four).IsCertain({0, 3}));

    EXPECT_EQ(b.Candidates(1, 2), ValueSet::Single(three));
    EXPECT_TRUE(b.Tracker(three).IsCertain({1, 2}));
    EXPECT_FALSE(b.Tracker(three).IsCertain({0, 3}));

    // P1's copy count no longer describes its hand; untouched adjacencies survive
    EXPECT_TRUE(b.Constraints().copy_counts.empty());
    ASSERT_EQ(b.Constraints().adjacent.size(), 2u);
    EXPECT_EQ(b.Constraints().adjacent[0], (AdjacentConstraint{1, 0, true}));
    EXPECT_EQ(b.Constraints().adjacent[1], (AdjacentConstraint{2, 2, false}));
    EXPECT_NO_THROW(debug::CheckInvariants(b));
}

TEST(Rules, Swap_Drops_Adjacency_Of_Exchanged_Slot)
{
    BeliefState b = MakeState();
    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 2, .position1 = 0, .position2 = 1, .is_equal = false}));
    ASSERT_TRUE(b.ProcessAdjacentSignal({.player = 2, .position1 = 2, .position2 = 3, .is_equal = false}));

    // P2 gives slot 1 away and the incoming wire takes its place
    ASSERT_TRUE(b.ProcessSwap({.player1 = 1, .player2 = 2, .init_pos1 = 0, .init_pos2 = 1,
                               .final_pos1 = 0, .final_pos2 = 1}));
    ASSERT_EQ(b.Constraints().adjacent.size(), 1u);
    EXPECT_EQ(b.Constraints().adjacent[0], (AdjacentConstraint{2, 2, false}));
}
