//
// Created by Malik T on 14/08/2025.
//

#ifndef BOMBBUSTER_ACTIONS_HPP
#define BOMBBUSTER_ACTIONS_HPP

#include <optional>
#include <variant>
#include "Types.hpp"

namespace bomb::core
{
    // Public game events, produced by the orchestrator in turn order.
    struct CallRecord
    {
        PlyrIdxT caller{};
        PlyrIdxT target{};
        SlotIdxT position{};
        WireValue value{};
        bool success{};
        // on success the caller reveals the matching wire of their own as well
        std::optional<SlotIdxT> caller_position{};
    };
    struct DoubleRevealRecord
    {
        PlyrIdxT player{};
        WireValue value{};
        SlotIdxT position1{};
        SlotIdxT position2{};
    };
    struct SignalRecord
    {
        PlyrIdxT player{};
        WireValue value{};
        SlotIdxT position{};
    };
    struct NotPresentRecord
    {
        PlyrIdxT player{};
        WireValue value{};
        // nullopt = the whole hand
        std::optional<SlotIdxT> position{};
    };
    struct SwapRecord
    {
        PlyrIdxT player1{};
        PlyrIdxT player2{};
        SlotIdxT init_pos1{};
        SlotIdxT init_pos2{};
        // insertion index into the hand while the outgoing wire is still in place
        SlotIdxT final_pos1{};
        SlotIdxT final_pos2{};
        std::optional<WireValue> received_value1{};
        std::optional<WireValue> received_value2{};
    };
    struct HasValueRecord
    {
        PlyrIdxT player{};
        WireValue value{};
    };
    struct CopyCountSignalRecord
    {
        PlyrIdxT player{};
        SlotIdxT position{};
        uint8_t copy_count{};
    };
    struct AdjacentSignalRecord
    {
        PlyrIdxT player{};
        SlotIdxT position1{};
        SlotIdxT position2{};
        bool is_equal{};
    };

    using ActionRecord = std::variant<
        CallRecord, DoubleRevealRecord, SignalRecord, NotPresentRecord,
        SwapRecord, HasValueRecord, CopyCountSignalRecord, AdjacentSignalRecord>;

} // namespace bomb::core

#endif //BOMBBUSTER_ACTIONS_HPP
