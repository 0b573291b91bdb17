//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_STATE_HPP
#define BOMBBUSTER_STATE_HPP

#include <compare>
#include <vector>
#include "Types.hpp"

namespace bomb::core
{
    // The wire at (player, slot) appears exactly `count` times in that player's hand.
    struct CopyCountConstraint
    {
        PlyrIdxT player{};
        SlotIdxT slot{};
        uint8_t count{};

        auto operator<=>(CopyCountConstraint const&) const = default;
    };

    // Slots `low` and `low + 1` of a player hold equal (or different) values.
    struct AdjacentConstraint
    {
        PlyrIdxT player{};
        SlotIdxT low{};
        bool is_equal{};

        auto operator<=>(AdjacentConstraint const&) const = default;
    };

    // Extra per-slot facts the candidate sets alone cannot express.
    struct SlotConstraints
    {
        std::vector<CopyCountConstraint> copy_counts;
        std::vector<AdjacentConstraint> adjacent;

        auto ForPlayer(PlyrIdxT p) const -> SlotConstraints
        {
            SlotConstraints out;
            for (auto const& c : copy_counts) if (c.player == p) out.copy_counts.push_back(c);
            for (auto const& c : adjacent) if (c.player == p) out.adjacent.push_back(c);
            return out;
        }

        auto Empty() const -> bool { return copy_counts.empty() && adjacent.empty(); }
    };
} // namespace bomb::core

#endif //BOMBBUSTER_STATE_HPP
