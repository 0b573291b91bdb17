//
// Created by Malik T on 02/10/2025.
//
#include "Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <utility>

namespace bomb::core::stats
{
    namespace
    {
        // Depth-first walk over every sorted hand a player may hold given the
        // candidate sets and the per-value copy caps.
        class HandWalker
        {
        public:
            using Visit = std::function<void(std::vector<ValueIdxT> const&)>;

            HandWalker(Hand const& beliefs, std::vector<uint8_t> const& deck, uint64_t limit, Visit visit) :
                beliefs_(beliefs), deck_(deck), limit_(limit), visit_(std::move(visit))
            {
                hand_.reserve(beliefs_.size());
                used_.assign(deck_.size(), 0);
            }

            // false once more than `limit` hands were found
            auto Run() -> bool { return Walk(0); }
            auto Seen() const noexcept -> uint64_t { return seen_; }

        private:
            auto Walk(size_t pos) -> bool
            {
                if (pos == beliefs_.size())
                {
                    if (++seen_ > limit_) return false;
                    visit_(hand_);
                    return true;
                }
                ValueIdxT const floor = hand_.empty() ? ValueIdxT{0} : hand_.back();
                for (ValueIdxT const v : beliefs_[pos])
                {
                    if (v < floor || used_[v] >= deck_[v]) continue;
                    ++used_[v];
                    hand_.push_back(v);
                    bool const keep_going = Walk(pos + 1);
                    hand_.pop_back();
                    --used_[v];
                    if (!keep_going) return false;
                }
                return true;
            }

            Hand const& beliefs_;
            std::vector<uint8_t> const& deck_;
            uint64_t limit_;
            Visit visit_;
            std::vector<ValueIdxT> hand_;
            std::vector<uint8_t> used_;
            uint64_t seen_{0};
        };

        auto OpenSlots(BeliefState const& state, PlyrIdxT p) -> std::vector<SlotIdxT>
        {
            std::vector<SlotIdxT> out;
            for (SlotIdxT s{}; s < state.HandSize(); ++s)
                if (!state.IsRevealed(p, s)) out.push_back(s);
            return out;
        }

        auto ExactDoubleChance(BeliefState const& state, PlyrIdxT target, ValueSet playable, uint64_t max_hands,
                               std::vector<DoubleChanceOption>& out) -> bool
        {
            size_t const H = state.HandSize();
            size_t const V = state.Domain().Size();
            std::vector<SlotIdxT> const open = OpenSlots(state, target);
            std::vector<uint64_t> hits(H * H * V, 0);
            auto const idx = [H, V](size_t i, size_t j, size_t v) { return (i * H + j) * V + v; };

            HandWalker walker(state.Grid()[target], state.Domain().Deck(), max_hands,
                              [&](std::vector<ValueIdxT> const& hand)
                              {
                                  for (size_t a{}; a < open.size(); ++a)
                                  {
                                      for (size_t b = a + 1; b < open.size(); ++b)
                                      {
                                          ValueIdxT const vi = hand[open[a]];
                                          ValueIdxT const vj = hand[open[b]];
                                          if (playable.Contains(vi)) ++hits[idx(open[a], open[b], vi)];
                                          if (vj != vi && playable.Contains(vj)) ++hits[idx(open[a], open[b], vj)];
                                      }
                                  }
                              });
            if (!walker.Run()) return false;
            if (walker.Seen() == 0) return true;

            auto const total = static_cast<double>(walker.Seen());
            for (size_t a{}; a < open.size(); ++a)
            {
                for (size_t b = a + 1; b < open.size(); ++b)
                {
                    for (ValueIdxT const v : playable)
                    {
                        uint64_t const n = hits[idx(open[a], open[b], v)];
                        if (n == 0) continue;
                        double const prob = static_cast<double>(n) / total;
                        out.push_back({.target = target, .slot1 = open[a], .slot2 = open[b], .value = v,
                                       .probability = prob, .is_certain = prob >= 0.999999, .approximate = false});
                    }
                }
            }
            return true;
        }

        auto ApproximateDoubleChance(BeliefState const& state, PlyrIdxT target, ValueSet playable,
                                     std::vector<DoubleChanceOption>& out) -> void
        {
            std::vector<SlotIdxT> const open = OpenSlots(state, target);
            Hand const& beliefs = state.Grid()[target];
            for (size_t a{}; a < open.size(); ++a)
            {
                for (size_t b = a + 1; b < open.size(); ++b)
                {
                    ValueSet const si = beliefs[open[a]];
                    ValueSet const sj = beliefs[open[b]];
                    for (ValueIdxT const v : playable)
                    {
                        double const pi = si.Contains(v) ? 1.0 / static_cast<double>(si.Size()) : 0.0;
                        double const pj = sj.Contains(v) ? 1.0 / static_cast<double>(sj.Size()) : 0.0;
                        double const prob = pi + pj - pi * pj;
                        if (prob <= 0.0) continue;
                        out.push_back({.target = target, .slot1 = open[a], .slot2 = open[b], .value = v,
                                       .probability = prob, .is_certain = false, .approximate = true});
                    }
                }
            }
        }
    }

    auto PositionEntropy(ValueSet s) -> double
    {
        return s.Size() <= 1 ? 0.0 : std::log2(static_cast<double>(s.Size()));
    }

    auto PlayerEntropy(BeliefState const& state, PlyrIdxT p) -> double
    {
        double h = 0.0;
        for (ValueSet const s : state.Grid().at(p)) h += PositionEntropy(s);
        return h;
    }

    auto SystemEntropy(BeliefState const& state) -> double
    {
        double h = 0.0;
        for (PlyrIdxT p{}; p < state.PlayerCount(); ++p) h += PlayerEntropy(state, p);
        return h;
    }

    auto PlayerStatistics(BeliefState const& state, PlyrIdxT p) -> PlayerStats
    {
        PlayerStats st;
        double const hand = state.HandSize();
        st.entropy = PlayerEntropy(state, p);
        double const max_entropy = hand * std::log2(static_cast<double>(state.Domain().Size()));
        st.entropy_normalized = max_entropy > 0.0 ? st.entropy / max_entropy : 0.0;

        size_t possibilities{};
        for (ValueSet const s : state.Grid().at(p))
        {
            if (s.IsSingle()) ++st.certain_count;
            else ++st.uncertain_count;
            possibilities += s.Size();
        }
        st.avg_possibilities = hand > 0 ? static_cast<double>(possibilities) / hand : 0.0;
        st.progress_percent = hand > 0 ? 100.0 * st.certain_count / hand : 0.0;
        return st;
    }

    auto SystemStatistics(BeliefState const& state) -> SystemStats
    {
        SystemStats st;
        for (PlyrIdxT p{}; p < state.PlayerCount(); ++p)
        {
            PlayerStats const ps = PlayerStatistics(state, p);
            st.total_entropy += ps.entropy;
            st.certain_positions += ps.certain_count;
            st.total_positions += ps.certain_count + ps.uncertain_count;
            if (state.IsFullyDeduced(p)) ++st.fully_deduced_players;
            st.players.push_back(ps);
        }
        st.progress_percent = st.total_positions > 0 ? 100.0 * st.certain_positions / st.total_positions : 0.0;
        return st;
    }

    auto PlayableValues(BeliefState const& state) -> ValueSet
    {
        ValueSet out;
        PlyrIdxT const me = state.Owner();
        for (SlotIdxT s{}; s < state.HandSize(); ++s)
        {
            if (state.IsRevealed(me, s)) continue;
            if (auto const v = state.OwnWire(s))
                out.Insert(*v);
            else if (ValueSet const c = state.Candidates(me, s); c.IsSingle())
                out.Insert(c.Min());
        }
        return out;
    }

    auto AllCallSuggestions(BeliefState const& state) -> CallSuggestions
    {
        CallSuggestions out;
        ValueSet const playable = PlayableValues(state);
        if (playable.Empty()) return out;

        for (PlyrIdxT t{}; t < state.PlayerCount(); ++t)
        {
            if (t == state.Owner()) continue;
            for (SlotIdxT s{}; s < state.HandSize(); ++s)
            {
                if (state.IsRevealed(t, s)) continue;
                ValueSet const cand = state.Candidates(t, s);
                auto const n = static_cast<uint8_t>(cand.Size());
                for (ValueIdxT const v : cand & playable)
                {
                    CallOption const opt{.target = t, .slot = s, .value = v, .n_possible = n,
                                         .probability = 1.0 / static_cast<double>(n)};
                    (n == 1 ? out.certain : out.uncertain).push_back(opt);
                }
            }
        }
        std::ranges::stable_sort(out.uncertain, {}, &CallOption::n_possible);
        return out;
    }

    auto DoubleChanceSuggestions(BeliefState const& state, uint64_t max_hands) -> std::vector<DoubleChanceOption>
    {
        std::vector<DoubleChanceOption> out;
        ValueSet const playable = PlayableValues(state);
        if (playable.Empty()) return out;

        for (PlyrIdxT t{}; t < state.PlayerCount(); ++t)
        {
            if (t == state.Owner()) continue;
            std::vector<DoubleChanceOption> mine;
            if (!ExactDoubleChance(state, t, playable, max_hands, mine))
            {
                mine.clear();
                ApproximateDoubleChance(state, t, playable, mine);
            }
            out.insert(out.end(), mine.begin(), mine.end());
        }
        std::ranges::stable_sort(out, std::ranges::greater{}, &DoubleChanceOption::probability);
        return out;
    }
}
