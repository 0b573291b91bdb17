//
// Created by Malik T on 19/08/2025.
//

#ifndef BOMBBUSTER_INSPECTOR_HPP
#define BOMBBUSTER_INSPECTOR_HPP

#include <optional>
#include <vector>

#include "../core/BeliefState.hpp"
#include "../core/Types.hpp"

namespace bomb::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            PlyrIdxT owner{};
            PlyrIdxT n_players{};
            SlotIdxT hand_size{};
            std::vector<std::optional<ValueIdxT>> my_hand;
            BeliefGrid grid;
            std::vector<ValueTracker> trackers;
            SlotConstraints constraints;
            std::vector<uint8_t> deck;
            bool contradiction{};
        };

        static inline auto Gather(BeliefState const& b) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.owner = b.me_;
            ret.n_players = b.domain_->NPlayers();
            ret.hand_size = b.domain_->HandSize();
            ret.my_hand = b.my_hand_;
            ret.grid = b.grid_;
            ret.trackers = b.trackers_;
            ret.constraints = b.constraints_;
            ret.deck = b.domain_->Deck();
            ret.contradiction = b.contradiction_;
            return ret;
        }
    };
}

#endif //BOMBBUSTER_INSPECTOR_HPP
