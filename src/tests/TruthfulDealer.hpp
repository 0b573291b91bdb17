//
// Created by Malik T on 08/10/2025.
//

#ifndef BOMBBUSTER_TRUTHFULDEALER_HPP
#define BOMBBUSTER_TRUTHFULDEALER_HPP

#include <optional>
#include <random>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Domain.hpp"
#include "../core/Types.hpp"

namespace bomb::test
{
    // Hidden deal plus a stream of public records that never lie about it.
    // Swaps are applied to the deal so the truth always matches the table.
    class TruthfulDealer
    {
    public:
        TruthfulDealer(core::Config const& cfg, uint64_t seed);

        auto Truth() const noexcept -> std::vector<std::vector<core::ValueIdxT>> const& { return hands_; }
        auto Domain() const noexcept -> core::ValueDomain const& { return dom_; }
        auto WireValues(core::PlyrIdxT p) const -> std::vector<core::WireValue>;
        auto IsRevealed(core::PlyrIdxT p, core::SlotIdxT s) const -> bool { return revealed_.at(p).at(s); }

        // Random record as the owner would observe it. Only the owner's
        // received value is filled in on a swap.
        auto Next(core::PlyrIdxT owner) -> core::ActionRecord;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }
        auto coin() -> bool { return std::bernoulli_distribution{0.5}(rng_); }
        auto AnyPlayer() -> core::PlyrIdxT;
        auto OtherPlayer(core::PlyrIdxT not_this) -> core::PlyrIdxT;
        auto OpenSlots(core::PlyrIdxT p) const -> std::vector<core::SlotIdxT>;

        auto MakeCall() -> std::optional<core::ActionRecord>;
        auto MakeDoubleReveal() -> std::optional<core::ActionRecord>;
        auto MakeSignal() -> std::optional<core::ActionRecord>;
        auto MakeNotPresent() -> std::optional<core::ActionRecord>;
        auto MakeSwap(core::PlyrIdxT owner) -> std::optional<core::ActionRecord>;
        auto MakeHasValue() -> std::optional<core::ActionRecord>;
        auto MakeCopyCount() -> core::ActionRecord;
        auto MakeAdjacent() -> std::optional<core::ActionRecord>;

    private:
        core::ValueDomain dom_;
        std::mt19937_64 rng_;
        std::vector<std::vector<core::ValueIdxT>> hands_;
        std::vector<std::vector<bool>> revealed_;
    };
}

#endif //BOMBBUSTER_TRUTHFULDEALER_HPP
