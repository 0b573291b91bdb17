//
// Created by Malik T on 02/10/2025.
//

#ifndef BOMBBUSTER_STATISTICS_HPP
#define BOMBBUSTER_STATISTICS_HPP

#include <cstdint>
#include <vector>
#include "BeliefState.hpp"
#include "Types.hpp"
#include "ValueSet.hpp"

namespace bomb::core::stats
{
    // log2 of the candidate count, 0 for a decided slot
    auto PositionEntropy(ValueSet s) -> double;
    auto PlayerEntropy(BeliefState const& state, PlyrIdxT p) -> double;
    auto SystemEntropy(BeliefState const& state) -> double;

    struct PlayerStats
    {
        double entropy{};
        double entropy_normalized{};
        uint32_t certain_count{};
        uint32_t uncertain_count{};
        double avg_possibilities{};
        double progress_percent{};
    };

    struct SystemStats
    {
        double total_entropy{};
        uint32_t certain_positions{};
        uint32_t total_positions{};
        double progress_percent{};
        uint32_t fully_deduced_players{};
        std::vector<PlayerStats> players;
    };

    auto PlayerStatistics(BeliefState const& state, PlyrIdxT p) -> PlayerStats;
    auto SystemStatistics(BeliefState const& state) -> SystemStats;

    // Values the owner still holds on an unrevealed slot.
    auto PlayableValues(BeliefState const& state) -> ValueSet;

    struct CallOption
    {
        PlyrIdxT target{};
        SlotIdxT slot{};
        ValueIdxT value{};
        uint8_t n_possible{};
        double probability{};
    };

    struct CallSuggestions
    {
        std::vector<CallOption> certain;
        // ascending by n_possible
        std::vector<CallOption> uncertain;
    };

    auto AllCallSuggestions(BeliefState const& state) -> CallSuggestions;

    struct DoubleChanceOption
    {
        PlyrIdxT target{};
        SlotIdxT slot1{};
        SlotIdxT slot2{};
        ValueIdxT value{};
        double probability{};
        bool is_certain{};
        // independence estimate p_i + p_j - p_i*p_j, an upper bound
        bool approximate{};
    };

    // One call naming two slots of the same target. Exact when a target has
    // at most max_hands consistent hands, approximate beyond that.
    // Sorted by probability, descending.
    auto DoubleChanceSuggestions(BeliefState const& state, uint64_t max_hands) -> std::vector<DoubleChanceOption>;
}

#endif //BOMBBUSTER_STATISTICS_HPP
