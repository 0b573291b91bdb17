//
// Created by Malik T on 19/08/2025.
//

#ifndef BOMBBUSTER_INVARIANTS_HPP
#define BOMBBUSTER_INVARIANTS_HPP

#include <format>
#include <span>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"

namespace bomb::core::debug
{
    // Structural checks on a belief state. Throws AssertionError on the first failure.
    // Slot-level checks are skipped once the state has flagged a contradiction.
    inline auto CheckInvariants(BeliefState const& b) -> void
    {
#if BMB_ENABLE_TEST_HOOKS == false
        (void)b;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(b);

        // 1) Shape
        BMB_ASSERT(s.grid.size() == s.n_players, "grid has the wrong player count");
        for (Hand const& h : s.grid)
            BMB_ASSERT(h.size() == s.hand_size, "grid has the wrong hand size");
        BMB_ASSERT(s.trackers.size() == s.deck.size(), "one tracker per value");

        // 2) Conservation: revealed + certain + called + uncertain == total
        for (ValueTracker const& t : s.trackers)
        {
            BMB_ASSERT(t.Total() == s.deck[t.Value()], "tracker total differs from the deck");
            BMB_ASSERT(t.Uncertain() >= 0, std::format("value rank {} over-accounted", t.Value()));
            BMB_ASSERT(t.Revealed().size() + t.Certain().size() + t.Called().size()
                       + static_cast<size_t>(t.Uncertain()) == t.Total(), "tracker does not sum to total");
        }

        if (s.contradiction) return;

        // 3) No empty candidate set
        for (PlyrIdxT p{}; p < s.n_players; ++p)
            for (SlotIdxT i{}; i < s.hand_size; ++i)
                BMB_ASSERT(!s.grid[p][i].Empty(), std::format("P{}[{}] has no candidate", p, i));

        // 4) Tracked slots are pinned to their value, and tracked once
        std::vector<std::vector<int>> owner_of(s.n_players, std::vector<int>(s.hand_size, -1));
        for (ValueTracker const& t : s.trackers)
        {
            auto const track = [&](SlotRef at)
            {
                BMB_ASSERT(s.grid[at.player][at.slot] == ValueSet::Single(t.Value()),
                           std::format("P{}[{}] tracked but not pinned", at.player, at.slot));
                BMB_ASSERT(owner_of[at.player][at.slot] == -1,
                           std::format("P{}[{}] tracked by two values", at.player, at.slot));
                owner_of[at.player][at.slot] = t.Value();
            };
            for (SlotRef const at : t.Revealed()) track(at);
            for (SlotRef const at : t.Certain()) track(at);
        }

        // 5) Own known wires are pinned
        for (SlotIdxT i{}; i < s.hand_size; ++i)
        {
            if (s.my_hand[i])
                BMB_ASSERT(s.grid[s.owner][i] == ValueSet::Single(*s.my_hand[i]),
                           std::format("own slot {} not pinned to its wire", i));
        }
#endif // BMB_ENABLE_TEST_HOOKS == true
    }

    // Adds soundness against the hidden deal: truth[p][s] is always a candidate.
    inline auto CheckInvariants(BeliefState const& b, std::span<std::vector<ValueIdxT> const> truth) -> void
    {
        CheckInvariants(b);
#if BMB_ENABLE_TEST_HOOKS == true
        BMB_ASSERT(truth.size() == b.PlayerCount(), "truth has the wrong player count");
        for (PlyrIdxT p{}; p < b.PlayerCount(); ++p)
        {
            for (SlotIdxT i{}; i < b.HandSize(); ++i)
            {
                BMB_ASSERT(b.Candidates(p, i).Contains(truth[p][i]),
                           std::format("P{}[{}] lost its true value {}", p, i, b.Domain().Format(truth[p][i])));
            }
        }
#endif
    }
}
#endif //BOMBBUSTER_INVARIANTS_HPP
