//
// Created by Malik T on 15/08/2025.
//

#ifndef BOMBBUSTER_BELIEFSTATE_HPP
#define BOMBBUSTER_BELIEFSTATE_HPP

#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>
#include "Actions.hpp"
#include "Domain.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"
#include "ValueSet.hpp"
#include "ValueTracker.hpp"

namespace bomb::core::debug {struct Inspector;}
namespace bomb::core
{
    class GlobalSolver;
    class Rules;

    // One player's view of every hand: a candidate set per (player, slot)
    // plus a tracker per value. Mutated only through Process*.
    class BeliefState
    {
    public:
        using CheckResult = error::ValidateResult;

        BeliefState() = delete;
        BeliefState(Config const& config,
                    PlyrIdxT me,
                    std::span<WireValue const> my_hand,
                    std::shared_ptr<GlobalSolver> solver = nullptr);

        // Rebuilds a saved state as is, without running any filter.
        // A state saved after a contradiction comes back contradicted.
        static auto Restore(Config const& config,
                            PlyrIdxT me,
                            BeliefGrid grid,
                            std::vector<ValueTracker> trackers,
                            SlotConstraints constraints,
                            bool contradicted = false,
                            std::shared_ptr<GlobalSolver> solver = nullptr) -> BeliefState;

        // Validate the record, apply it and run the filters to a fixed point.
        // Nothing changes when validation fails.
        auto Process(ActionRecord const& record) -> CheckResult;
        auto ProcessCall(CallRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessDoubleReveal(DoubleRevealRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessSignal(SignalRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessNotPresent(NotPresentRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessSwap(SwapRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessHasValue(HasValueRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessCopyCountSignal(CopyCountSignalRecord const& r) -> CheckResult { return Process(r); }
        auto ProcessAdjacentSignal(AdjacentSignalRecord const& r) -> CheckResult { return Process(r); }

        // Local fixed point, then (if enabled) alternate with the global solver
        // until nothing changes. Returns true if anything changed.
        auto ApplyFilters() -> bool;
        auto ApplyLocalFilters() -> bool;

        // Hypothetical edits for look-ahead on clones. No validation, no filters.
        auto AssumeValue(SlotRef at, ValueIdxT v) -> void;
        auto AssumeNotValue(SlotRef at, ValueIdxT v) -> void;

        // Queries
        auto Candidates(PlyrIdxT p, SlotIdxT s) const -> ValueSet { return grid_.at(p).at(s); }
        auto Grid() const noexcept -> BeliefGrid const& { return grid_; }
        auto Trackers() const noexcept -> std::vector<ValueTracker> const& { return trackers_; }
        auto Tracker(ValueIdxT v) const -> ValueTracker const& { return trackers_.at(v); }
        auto Constraints() const noexcept -> SlotConstraints const& { return constraints_; }
        auto Domain() const noexcept -> ValueDomain const& { return *domain_; }
        auto Cfg() const noexcept -> Config const& { return cfg_; }
        auto Owner() const noexcept -> PlyrIdxT { return me_; }
        auto PlayerCount() const noexcept -> PlyrIdxT { return domain_->NPlayers(); }
        auto HandSize() const noexcept -> SlotIdxT { return domain_->HandSize(); }
        auto Solver() const noexcept -> std::shared_ptr<GlobalSolver> const& { return solver_; }
        auto SetSolver(std::shared_ptr<GlobalSolver> solver) -> void { solver_ = std::move(solver); }

        // No empty candidate set and no contradiction detected so far.
        auto IsConsistent() const -> bool;
        auto IsFullyDeduced(PlyrIdxT p) const -> bool;
        auto IsRevealed(PlyrIdxT p, SlotIdxT s) const -> bool;
        auto CertainPositions(PlyrIdxT p) const -> std::vector<std::pair<SlotIdxT, ValueIdxT>>;
        auto UncertainPositions(PlyrIdxT p) const -> std::vector<SlotIdxT>;
        // owner's wire at a slot, nullopt if unknown (informal swap without received value)
        auto OwnWire(SlotIdxT s) const -> std::optional<ValueIdxT> { return my_hand_.at(s); }

        friend class BombRules;
        friend struct debug::Inspector;

    private:
        BeliefState(Config const& config, PlyrIdxT me, std::shared_ptr<GlobalSolver> solver);

        auto FlagContradiction(std::string_view why) -> void;
        // Intersect a slot with keep. Refuses to empty the slot.
        auto Restrict(SlotRef at, ValueSet keep) -> bool;
        auto RemoveValue(SlotRef at, ValueIdxT v) -> bool;
        // Public confirmation: overwrite the slot with {v}.
        auto Pin(SlotRef at, ValueIdxT v) -> void;

        auto OrderingFilter() -> bool;
        auto DistanceFilter() -> bool;
        auto SubsetFilter() -> bool;
        auto ExistenceThresholdFilter() -> bool;
        auto ConstraintFilter() -> bool;
        auto UpdateValueTrackers() -> bool;
        auto RunGlobalSolver() -> bool;
        auto AdoptDeducedOwnWires() -> void;

    private:
        Config cfg_;
        std::shared_ptr<ValueDomain const> domain_;
        std::shared_ptr<Rules const> rules_;
        std::shared_ptr<GlobalSolver> solver_;
        PlyrIdxT me_{};

        std::vector<std::optional<ValueIdxT>> my_hand_;
        BeliefGrid grid_;                     // [player][slot]
        std::vector<ValueTracker> trackers_;  // [value rank]
        SlotConstraints constraints_;
        bool contradiction_{false};
    };
}
#endif //BOMBBUSTER_BELIEFSTATE_HPP
