//
// Created by Malik T on 15/08/2025.
//

#ifndef BOMBBUSTER_BOMBRULES_HPP
#define BOMBBUSTER_BOMBRULES_HPP
#include "Rules.hpp"

namespace bomb::core
{
    class BombRules final : public Rules
    {
    public:
        auto Validate(BeliefState const& state, ActionRecord const& a) const -> CheckResult override;
        auto Apply(BeliefState& state, ActionRecord const& a) const -> void override;

        // Where a wire that stayed in a swapping hand ends up. `init` is the
        // slot that left the hand, `final_pos` the slot the incoming wire lands on.
        static auto ShiftedPosition(SlotIdxT old_pos, SlotIdxT init, SlotIdxT final_pos) -> SlotIdxT;
        // Landing slot of an incoming wire inserted at `final_pos` while the outgoing one was still in place.
        static auto EffectiveFinal(SlotIdxT init, SlotIdxT final_pos) -> SlotIdxT;

    private:
        static auto ApplySwap(BeliefState& st, SwapRecord const& act) -> void;
    };
}

#endif //BOMBBUSTER_BOMBRULES_HPP
