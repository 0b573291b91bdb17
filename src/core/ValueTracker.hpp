//
// Created by Malik T on 03/10/2025.
//

#ifndef BOMBBUSTER_VALUETRACKER_HPP
#define BOMBBUSTER_VALUETRACKER_HPP

#include <vector>
#include "Types.hpp"

namespace bomb::core
{
    // Bookkeeping of where the copies of one value are known to be.
    // revealed: publicly confirmed slots, certain: deduced slots,
    // called: players holding a copy at an unknown slot.
    class ValueTracker
    {
    public:
        ValueTracker(ValueIdxT value, uint8_t total);

        // Each transition returns false (and changes nothing) when it would
        // need more copies than the game holds.
        [[nodiscard]] auto AddRevealed(SlotRef at) -> bool;
        [[nodiscard]] auto AddCertain(SlotRef at) -> bool;
        [[nodiscard]] auto AddCalled(PlyrIdxT player) -> bool;

        // Wholesale replacement used by swaps and persistence. Fails if the
        // entries overlap or account for more than total copies.
        [[nodiscard]] auto Replace(std::vector<SlotRef> revealed,
                                   std::vector<SlotRef> certain,
                                   std::vector<PlyrIdxT> called) -> bool;

        auto Value() const noexcept -> ValueIdxT { return value_; }
        auto Total() const noexcept -> uint8_t { return total_; }
        auto Revealed() const noexcept -> std::vector<SlotRef> const& { return revealed_; }
        auto Certain() const noexcept -> std::vector<SlotRef> const& { return certain_; }
        auto Called() const noexcept -> std::vector<PlyrIdxT> const& { return called_; }

        auto Uncertain() const noexcept -> int;
        auto IsFullyAccounted() const noexcept -> bool { return Uncertain() == 0; }

        auto IsRevealed(SlotRef at) const -> bool;
        auto IsCertain(SlotRef at) const -> bool;
        auto IsTracked(SlotRef at) const -> bool { return IsRevealed(at) || IsCertain(at); }
        auto IsCalled(PlyrIdxT player) const -> bool;
        auto HasCertainFor(PlyrIdxT player) const -> bool;
        auto HasPinnedFor(PlyrIdxT player) const -> bool;
        // revealed + certain slots of one player
        auto PinnedFor(PlyrIdxT player) const -> std::vector<SlotIdxT>;

    private:
        ValueIdxT value_;
        uint8_t total_;
        std::vector<SlotRef> revealed_;
        std::vector<SlotRef> certain_;
        std::vector<PlyrIdxT> called_;
    };
}

#endif //BOMBBUSTER_VALUETRACKER_HPP
