//
// Created by Malik T on 15/08/2025.
//
#include "BeliefState.hpp"

#include <algorithm>
#include <bit>
#include <format>
#include <ranges>
#include "BombRules.hpp"
#include "GlobalSolver.hpp"
#include "Log.hpp"

namespace bomb::core
{
    BeliefState::BeliefState(Config const& config, PlyrIdxT me, std::shared_ptr<GlobalSolver> solver) :
        cfg_(config),
        domain_(std::make_shared<ValueDomain const>(config)),
        rules_(std::make_shared<BombRules const>()),
        solver_(std::move(solver)),
        me_(me)
    {
        if (me_ >= domain_->NPlayers())
            BMB_THROW(error::Code::Config, std::format("owner P{} out of range for {} players",
                                                       static_cast<int>(me_), static_cast<int>(domain_->NPlayers())));
        my_hand_.assign(domain_->HandSize(), std::nullopt);
        grid_.assign(domain_->NPlayers(), Hand(domain_->HandSize(), domain_->FullSet()));
        trackers_.reserve(domain_->Size());
        for (size_t v{}; v < domain_->Size(); ++v)
        {
            trackers_.emplace_back(static_cast<ValueIdxT>(v), domain_->Copies(static_cast<ValueIdxT>(v)));
        }
    }

    BeliefState::BeliefState(Config const& config,
                             PlyrIdxT me,
                             std::span<WireValue const> my_hand,
                             std::shared_ptr<GlobalSolver> solver) :
        BeliefState(config, me, std::move(solver))
    {
        using error::Code;
        if (my_hand.size() != domain_->HandSize())
            BMB_THROW(Code::Config, std::format("own hand has {} wires, expected {}",
                                                my_hand.size(), static_cast<int>(domain_->HandSize())));

        for (size_t s{}; s < my_hand.size(); ++s)
        {
            std::optional<ValueIdxT> const v = domain_->IndexOf(my_hand[s]);
            if (!v)
                BMB_THROW(Code::Config, std::format("own wire {} is not in the distribution", my_hand[s]));
            if (s > 0 && *v < *my_hand_[s - 1])
                BMB_THROW(Code::Config, "own hand must be sorted");

            SlotRef const at{me_, static_cast<SlotIdxT>(s)};
            my_hand_[s] = v;
            grid_[me_][s] = ValueSet::Single(*v);
            if (!trackers_[*v].AddCertain(at))
                BMB_THROW(Code::Config, std::format("own hand holds more copies of {} than exist", my_hand[s]));
        }

        ApplyFilters();
    }

    auto BeliefState::Restore(Config const& config,
                              PlyrIdxT me,
                              BeliefGrid grid,
                              std::vector<ValueTracker> trackers,
                              SlotConstraints constraints,
                              bool contradicted,
                              std::shared_ptr<GlobalSolver> solver) -> BeliefState
    {
        using error::Code;
        BeliefState out(config, me, std::move(solver));

        if (grid.size() != out.grid_.size()
            || std::ranges::any_of(grid, [&](Hand const& h) { return h.size() != out.HandSize(); }))
            BMB_THROW(Code::State, "restored grid does not match the configured shape");
        if (trackers.size() != out.trackers_.size())
            BMB_THROW(Code::State, "restored trackers do not match the value domain");
        for (size_t v{}; v < trackers.size(); ++v)
        {
            if (trackers[v].Value() != v || trackers[v].Total() != out.domain_->Copies(static_cast<ValueIdxT>(v)))
                BMB_THROW(Code::State, std::format("restored tracker {} does not match the distribution", v));
        }

        out.grid_ = std::move(grid);
        out.trackers_ = std::move(trackers);
        out.constraints_ = std::move(constraints);
        for (size_t s{}; s < out.my_hand_.size(); ++s)
        {
            ValueSet const own = out.grid_[me][s];
            out.my_hand_[s] = own.IsSingle() ? std::optional<ValueIdxT>{own.Min()} : std::nullopt;
        }
        out.contradiction_ = contradicted || !out.IsConsistent();
        return out;
    }

    auto BeliefState::Process(ActionRecord const& record) -> CheckResult
    {
        if (auto ok = rules_->Validate(*this, record); !ok)
        {
            log::Info(cfg_.verbose, "P{} rejected record: {}", static_cast<int>(me_), error::describe(ok.error()));
            return ok;
        }
        rules_->Apply(*this, record);
        ApplyFilters();
        return {};
    }

    auto BeliefState::FlagContradiction(std::string_view why) -> void
    {
        if (!contradiction_)
            log::Warn("P{} belief contradiction: {}", static_cast<int>(me_), why);
        else
            log::Info(cfg_.verbose, "P{} further contradiction: {}", static_cast<int>(me_), why);
        contradiction_ = true;
    }

    auto BeliefState::Restrict(SlotRef at, ValueSet keep) -> bool
    {
        ValueSet& cur = grid_[at.player][at.slot];
        ValueSet const next = cur & keep;
        if (next == cur) return false;
        if (next.Empty())
        {
            FlagContradiction(std::format("P{}[{}] {} would lose its last candidate",
                                          static_cast<int>(at.player), static_cast<int>(at.slot),
                                          domain_->Format(cur)));
            return false;
        }
        cur = next;
        return true;
    }

    auto BeliefState::RemoveValue(SlotRef at, ValueIdxT v) -> bool
    {
        return Restrict(at, ValueSet{~ValueSet::Single(v).Bits()});
    }

    auto BeliefState::Pin(SlotRef at, ValueIdxT v) -> void
    {
        ValueSet& cur = grid_[at.player][at.slot];
        if (!cur.Contains(v))
            FlagContradiction(std::format("P{}[{}] confirmed as {} but candidates were {}",
                                          static_cast<int>(at.player), static_cast<int>(at.slot),
                                          domain_->Format(v), domain_->Format(cur)));
        cur = ValueSet::Single(v);
    }

    auto BeliefState::AssumeValue(SlotRef at, ValueIdxT v) -> void
    {
        grid_.at(at.player).at(at.slot) = ValueSet::Single(v);
    }

    auto BeliefState::AssumeNotValue(SlotRef at, ValueIdxT v) -> void
    {
        grid_.at(at.player).at(at.slot).Erase(v);
    }

    // ---------- local filters ----------

    auto BeliefState::OrderingFilter() -> bool
    {
        bool changed = false;
        SlotIdxT const W = HandSize();
        for (PlyrIdxT p{}; p < PlayerCount(); ++p)
        {
            Hand const& h = grid_[p];
            // max at slot i bounds everything to its left
            for (SlotIdxT pos{}; pos < W; ++pos)
            {
                if (h[pos].Empty()) continue;
                ValueSet const keep = ValueSet::UpTo(h[pos].Max());
                for (SlotIdxT left{}; left < pos; ++left)
                    changed |= Restrict({p, left}, keep);
            }
            // min at slot i bounds everything to its right
            for (SlotIdxT pos{}; pos < W; ++pos)
            {
                if (h[pos].Empty()) continue;
                ValueSet const keep = ValueSet::From(h[pos].Min());
                for (SlotIdxT right = pos + 1; right < W; ++right)
                    changed |= Restrict({p, right}, keep);
            }
        }
        return changed;
    }

    auto BeliefState::DistanceFilter() -> bool
    {
        bool changed = false;
        int const W = HandSize();
        for (PlyrIdxT p{}; p < PlayerCount(); ++p)
        {
            for (ValueIdxT v{}; v < domain_->Size(); ++v)
            {
                ValueTracker const& t = trackers_[v];

                uint64_t anchors{0};
                for (SlotIdxT s{}; s < W; ++s)
                {
                    if (grid_[p][s] == ValueSet::Single(v)) anchors |= uint64_t{1} << s;
                }
                for (SlotRef const& r : t.Revealed())
                {
                    if (r.player == p) anchors |= uint64_t{1} << r.slot;
                }
                if (anchors == 0) continue;

                int const window = std::popcount(anchors) + t.Uncertain() + (t.IsCalled(p) ? 1 : 0);
                if (window >= W) continue;

                int const lo = std::countr_zero(anchors);
                int const hi = 63 - std::countl_zero(anchors);
                if (hi - lo + 1 > window)
                {
                    FlagContradiction(std::format("P{} holds {} at slots {}..{}, more than {} copies apart",
                                                  static_cast<int>(p), domain_->Format(v), lo, hi, window));
                    continue;
                }

                // union of every window of this size that covers all anchors
                int const first = std::max(0, hi - window + 1);
                int const last = std::min(W - 1, lo + window - 1);
                for (int s{}; s < W; ++s)
                {
                    if (s >= first && s <= last) continue;
                    changed |= RemoveValue({p, static_cast<SlotIdxT>(s)}, v);
                }
            }
        }
        return changed;
    }

    auto BeliefState::SubsetFilter() -> bool
    {
        bool changed = false;

        ValueSet seen{};
        for (Hand const& h : grid_)
            for (ValueSet const s : h) seen |= s;

        std::vector<ValueIdxT> const vals(seen.begin(), seen.end());
        size_t const k = vals.size();
        if (k <= 2) return false;

        size_t const max_h = std::min<size_t>(k - 1, cfg_.subset_filter_max_size);
        std::vector<SlotRef> matching;
        matching.reserve(max_h + 1);

        for (size_t h = 2; h <= max_h; ++h)
        {
            // Gosper's hack over the k observed values
            uint64_t comb = (uint64_t{1} << h) - 1;
            uint64_t const last = comb << (k - h);
            for (;;)
            {
                ValueSet combo{};
                for (uint64_t bits = comb; bits; bits &= bits - 1)
                    combo.Insert(vals[std::countr_zero(bits)]);

                matching.clear();
                for (PlyrIdxT p{}; p < PlayerCount() && matching.size() <= h; ++p)
                {
                    for (SlotIdxT s{}; s < HandSize(); ++s)
                    {
                        if (!grid_[p][s].Intersects(combo)) continue;
                        matching.push_back({p, s});
                        if (matching.size() > h) break;
                    }
                }

                if (matching.size() == h)
                {
                    for (SlotRef const at : matching)
                        changed |= Restrict(at, combo);
                }

                if (comb == last) break;
                uint64_t const c = comb & (~comb + 1);
                uint64_t const r = comb + c;
                comb = (((r ^ comb) >> 2) / c) | r;
            }
        }
        return changed;
    }

    auto BeliefState::ExistenceThresholdFilter() -> bool
    {
        bool changed = false;
        int const W = HandSize();
        size_t const K = domain_->Size();

        std::vector<int> avail(K);
        for (PlyrIdxT p{}; p < PlayerCount(); ++p)
        {
            // most copies of each value this player can still hold
            for (ValueIdxT v{}; v < K; ++v)
            {
                ValueTracker const& t = trackers_[v];
                avail[v] = std::max(0, t.Uncertain()) + (t.IsCalled(p) ? 1 : 0)
                         + static_cast<int>(t.PinnedFor(p).size());
                if (avail[v] == 0)
                {
                    for (SlotIdxT s{}; s < W; ++s)
                        changed |= RemoveValue({p, s}, v);
                }
            }

            // high values with few copies cannot sit too far left
            int threshold = W;
            for (size_t i = K; i-- > 0;)
            {
                if (avail[i] == 0) continue;
                threshold -= avail[i];
                if (threshold > 0 && threshold < W)
                {
                    for (int s{}; s < threshold; ++s)
                        changed |= RemoveValue({p, static_cast<SlotIdxT>(s)}, static_cast<ValueIdxT>(i));
                }
            }

            // and low values cannot sit too far right
            threshold = 0;
            for (size_t i{}; i < K; ++i)
            {
                if (avail[i] == 0) continue;
                threshold += avail[i];
                if (threshold > 0 && threshold < W)
                {
                    for (int s = threshold; s < W; ++s)
                        changed |= RemoveValue({p, static_cast<SlotIdxT>(s)}, static_cast<ValueIdxT>(i));
                }
            }
        }
        return changed;
    }

    auto BeliefState::ConstraintFilter() -> bool
    {
        bool changed = false;
        int const W = HandSize();

        for (CopyCountConstraint const& c : constraints_.copy_counts)
        {
            ValueSet keep{};
            for (ValueIdxT v{}; v < domain_->Size(); ++v)
                if (domain_->Copies(v) >= c.count) keep.Insert(v);
            changed |= Restrict({c.player, c.slot}, keep);

            // a known value occupies exactly `count` consecutive slots around this one
            ValueSet const here = grid_[c.player][c.slot];
            if (!here.IsSingle()) continue;
            int const lo = static_cast<int>(c.slot) - c.count + 1;
            int const hi = static_cast<int>(c.slot) + c.count - 1;
            for (int s{}; s < W; ++s)
            {
                if (s >= lo && s <= hi) continue;
                changed |= RemoveValue({c.player, static_cast<SlotIdxT>(s)}, here.Min());
            }
            if (c.count == 1)
            {
                if (c.slot > 0) changed |= RemoveValue({c.player, static_cast<SlotIdxT>(c.slot - 1)}, here.Min());
                if (c.slot + 1 < W) changed |= RemoveValue({c.player, static_cast<SlotIdxT>(c.slot + 1)}, here.Min());
            }
        }

        for (AdjacentConstraint const& c : constraints_.adjacent)
        {
            SlotRef const a{c.player, c.low};
            SlotRef const b{c.player, static_cast<SlotIdxT>(c.low + 1)};
            ValueSet const sa = grid_[a.player][a.slot];
            ValueSet const sb = grid_[b.player][b.slot];
            if (c.is_equal)
            {
                changed |= Restrict(a, sb);
                changed |= Restrict(b, sa);
            }
            else
            {
                if (sa.IsSingle()) changed |= RemoveValue(b, sa.Min());
                if (sb.IsSingle()) changed |= RemoveValue(a, sb.Min());
            }
        }
        return changed;
    }

    auto BeliefState::UpdateValueTrackers() -> bool
    {
        bool changed = false;
        for (PlyrIdxT p{}; p < PlayerCount(); ++p)
        {
            for (SlotIdxT s{}; s < HandSize(); ++s)
            {
                ValueSet const cur = grid_[p][s];
                if (!cur.IsSingle()) continue;
                SlotRef const at{p, s};
                ValueTracker& t = trackers_[cur.Min()];
                if (t.IsTracked(at)) continue;
                if (t.AddCertain(at))
                {
                    changed = true;
                    continue;
                }
                FlagContradiction(std::format("P{}[{}] deduced as {} but every copy is accounted for",
                                              static_cast<int>(p), static_cast<int>(s), domain_->Format(cur.Min())));
            }
        }
        return changed;
    }

    auto BeliefState::ApplyLocalFilters() -> bool
    {
        bool any = false;
        for (uint32_t it{};; ++it)
        {
            if (it >= cfg_.max_filter_iterations)
            {
                log::Warn("P{} filters did not settle after {} iterations", static_cast<int>(me_), it);
                break;
            }
            bool changed = false;
            changed |= OrderingFilter();
            changed |= DistanceFilter();
            changed |= SubsetFilter();
            changed |= ExistenceThresholdFilter();
            changed |= ConstraintFilter();
            changed |= UpdateValueTrackers();
            if (!changed) break;
            any = true;
        }
        return any;
    }

    auto BeliefState::RunGlobalSolver() -> bool
    {
        try
        {
            SolveOutcome const outcome = solver_->Solve(*this);
            if (outcome.status == SolveStatus::Contradiction)
            {
                log::Critical("P{} global solver: {}", static_cast<int>(me_), outcome.detail);
                FlagContradiction(outcome.detail);
                return false;
            }

            bool changed = false;
            for (PlyrIdxT p{}; p < PlayerCount(); ++p)
                for (SlotIdxT s{}; s < HandSize(); ++s)
                    changed |= Restrict({p, s}, outcome.grid[p][s]);
            return changed;
        }
        catch (error::TimeoutError const& e)
        {
            log::Warn("P{} global solver timed out, keeping local deductions: {}", static_cast<int>(me_), e.what());
        }
        catch (OmegaException<error::Code> const& e)
        {
            log::Warn("P{} global solver failed, keeping local deductions: {}", static_cast<int>(me_), e.what());
        }
        catch (std::exception const& e)
        {
            log::Warn("P{} global solver worker failed, keeping local deductions: {}", static_cast<int>(me_), e.what());
        }
        return false;
    }

    auto BeliefState::ApplyFilters() -> bool
    {
        bool any = ApplyLocalFilters();
        if (solver_ && cfg_.use_global_solver)
        {
            for (uint32_t round{}; round < cfg_.max_filter_iterations; ++round)
            {
                if (!IsConsistent()) break;
                if (!RunGlobalSolver()) break;
                any = true;
                if (!ApplyLocalFilters()) break;
            }
        }
        AdoptDeducedOwnWires();
        return any;
    }

    // an own wire nobody named becomes known once its slot is decided
    auto BeliefState::AdoptDeducedOwnWires() -> void
    {
        for (SlotIdxT s{}; s < HandSize(); ++s)
        {
            ValueSet const own = grid_[me_][s];
            if (!my_hand_[s] && own.IsSingle())
            {
                my_hand_[s] = own.Min();
                log::Info(cfg_.verbose, "P{} deduced own slot {} holds {}", static_cast<int>(me_),
                          static_cast<int>(s), domain_->Format(own.Min()));
            }
        }
    }

    // ---------- queries ----------

    auto BeliefState::IsConsistent() const -> bool
    {
        if (contradiction_) return false;
        return std::ranges::none_of(grid_, [](Hand const& h)
        {
            return std::ranges::any_of(h, [](ValueSet const s) { return s.Empty(); });
        });
    }

    auto BeliefState::IsFullyDeduced(PlyrIdxT p) const -> bool
    {
        return std::ranges::all_of(grid_.at(p), [](ValueSet const s) { return s.IsSingle(); });
    }

    auto BeliefState::IsRevealed(PlyrIdxT p, SlotIdxT s) const -> bool
    {
        ValueSet const cur = grid_.at(p).at(s);
        return cur.IsSingle() && trackers_[cur.Min()].IsRevealed({p, s});
    }

    auto BeliefState::CertainPositions(PlyrIdxT p) const -> std::vector<std::pair<SlotIdxT, ValueIdxT>>
    {
        std::vector<std::pair<SlotIdxT, ValueIdxT>> out;
        Hand const& h = grid_.at(p);
        for (SlotIdxT s{}; s < h.size(); ++s)
            if (h[s].IsSingle()) out.emplace_back(s, h[s].Min());
        return out;
    }

    auto BeliefState::UncertainPositions(PlyrIdxT p) const -> std::vector<SlotIdxT>
    {
        std::vector<SlotIdxT> out;
        Hand const& h = grid_.at(p);
        for (SlotIdxT s{}; s < h.size(); ++s)
            if (!h[s].IsSingle()) out.push_back(s);
        return out;
    }
}
