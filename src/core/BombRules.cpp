//
// Created by Malik T on 15/08/2025.
//

#include "BombRules.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include "BeliefState.hpp"
#include "Log.hpp"

namespace
{
    inline auto Viol(bomb::core::error::ActionViolationCode code) -> bomb::core::error::ActionViolation
    {
        return bomb::core::error::ActionViolation{ .code = code };
    }
}

namespace bomb::core
{
    static auto IndexOf(BeliefState const& st, WireValue v) -> std::optional<ValueIdxT>
    {
        return st.Domain().IndexOf(v);
    }

    static auto Strict(BeliefState const& st) -> bool
    {
        return !st.Cfg().playing_irl;
    }

    // known own wire at slot s equals v (unknown slots never disagree)
    static auto OwnMaybe(BeliefState const& st, SlotIdxT s, ValueIdxT v) -> bool
    {
        std::optional<ValueIdxT> const own = st.OwnWire(s);
        return !own || *own == v;
    }

    static auto OwnDefinitelyNot(BeliefState const& st, SlotIdxT s, ValueIdxT v) -> bool
    {
        std::optional<ValueIdxT> const own = st.OwnWire(s);
        return own && *own != v;
    }

    static auto OwnHolds(BeliefState const& st, ValueIdxT v, bool unrevealed_only) -> bool
    {
        for (SlotIdxT s{}; s < st.HandSize(); ++s)
        {
            if (unrevealed_only && st.IsRevealed(st.Owner(), s)) continue;
            if (OwnMaybe(st, s, v)) return true;
        }
        return false;
    }

    auto BombRules::EffectiveFinal(SlotIdxT init, SlotIdxT final_pos) -> SlotIdxT
    {
        return final_pos <= init ? final_pos : static_cast<SlotIdxT>(final_pos - 1);
    }

    auto BombRules::ShiftedPosition(SlotIdxT old_pos, SlotIdxT init, SlotIdxT final_pos) -> SlotIdxT
    {
        // exchanged wire
        if (old_pos == init) return final_pos;
        // before both / after both
        if (old_pos < init && old_pos < final_pos) return old_pos;
        if (old_pos > init && old_pos > final_pos) return old_pos;
        // incoming wire lands left of the gap: everything in between moves right
        if (old_pos < init) return static_cast<SlotIdxT>(old_pos + 1);
        // incoming wire lands right of the gap: everything in between moves left
        return static_cast<SlotIdxT>(old_pos - 1);
    }

auto BombRules::Validate(BeliefState const& st, ActionRecord const& a) const -> CheckResult
{
    using AVC = ::bomb::core::error::ActionViolationCode;

    PlyrIdxT const n = st.PlayerCount();
    SlotIdxT const W = st.HandSize();
    PlyrIdxT const me = st.Owner();
    bool const strict = Strict(st);

    auto bad_player = [n](PlyrIdxT p) { return p >= n; };
    auto bad_slot = [W](SlotIdxT s) { return s >= W; };

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, CallRecord>)
        {
            if (bad_player(act.caller))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.caller));
            if (bad_player(act.target))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_target(act.target));
            if (act.caller == act.target)
                return std::unexpected(Viol(AVC::Call_SelfTarget).with_player(act.caller));
            if (bad_slot(act.position))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_target(act.target).with_position(act.position));
            if (act.caller_position && bad_slot(*act.caller_position))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.caller)
                                       .with_position(*act.caller_position));

            std::optional<ValueIdxT> const v = IndexOf(st, act.value);
            if (!v)
                return std::unexpected(Viol(AVC::UnknownValue).with_value(act.value));

            if (st.IsRevealed(act.target, act.position))
                return std::unexpected(Viol(AVC::Call_TargetRevealed)
                                       .with_target(act.target).with_position(act.position));

            if (strict && act.caller == me)
            {
                if (!OwnHolds(st, *v, true))
                    return std::unexpected(Viol(AVC::Call_CallerLacksValue)
                                           .with_player(act.caller).with_value(act.value));
                if (act.caller_position && OwnDefinitelyNot(st, *act.caller_position, *v))
                    return std::unexpected(Viol(AVC::Call_CallerPositionMismatch)
                                           .with_player(act.caller).with_position(*act.caller_position)
                                           .with_value(act.value));
            }
            if (strict && act.target == me)
            {
                bool const wrong = act.success
                                       ? OwnDefinitelyNot(st, act.position, *v)
                                       : st.OwnWire(act.position) == v;
                if (wrong)
                    return std::unexpected(Viol(AVC::Call_OutcomeContradictsOwnHand)
                                           .with_target(act.target).with_position(act.position)
                                           .with_value(act.value));
            }
            return {};
        }
        else if constexpr (std::is_same_v<T, DoubleRevealRecord>)
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            if (bad_slot(act.position1))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position1));
            if (bad_slot(act.position2))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position2));
            if (act.position1 == act.position2)
                return std::unexpected(Viol(AVC::DoubleReveal_SamePosition)
                                       .with_player(act.player).with_position(act.position1));

            std::optional<ValueIdxT> const v = IndexOf(st, act.value);
            if (!v)
                return std::unexpected(Viol(AVC::UnknownValue).with_value(act.value));

            if (strict && act.player == me
                && (OwnDefinitelyNot(st, act.position1, *v) || OwnDefinitelyNot(st, act.position2, *v)))
                return std::unexpected(Viol(AVC::DoubleReveal_OwnHandMismatch)
                                       .with_player(act.player).with_value(act.value));
            return {};
        }
        else if constexpr (std::is_same_v<T, SignalRecord>)
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            if (bad_slot(act.position))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position));

            std::optional<ValueIdxT> const v = IndexOf(st, act.value);
            if (!v)
                return std::unexpected(Viol(AVC::UnknownValue).with_value(act.value));

            if (strict && act.player == me && OwnDefinitelyNot(st, act.position, *v))
                return std::unexpected(Viol(AVC::Signal_OwnHandMismatch)
                                       .with_player(act.player).with_position(act.position).with_value(act.value));
            return {};
        }
        else if constexpr (std::is_same_v<T, NotPresentRecord>)
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            if (act.position && bad_slot(*act.position))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(*act.position));

            std::optional<ValueIdxT> const v = IndexOf(st, act.value);
            if (!v)
                return std::unexpected(Viol(AVC::UnknownValue).with_value(act.value));

            if (strict && act.player == me)
            {
                bool const holds = act.position ? st.OwnWire(*act.position) == v
                                                : std::ranges::any_of(std::views::iota(0, static_cast<int>(W)),
                                                      [&](int s) { return st.OwnWire(static_cast<SlotIdxT>(s)) == v; });
                if (holds)
                    return std::unexpected(Viol(AVC::NotPresent_OwnHandMismatch)
                                           .with_player(act.player).with_value(act.value));
            }
            return {};
        }
        else if constexpr (std::is_same_v<T, SwapRecord>)
        {
            if (bad_player(act.player1))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player1));
            if (bad_player(act.player2))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player2));
            if (act.player1 == act.player2)
                return std::unexpected(Viol(AVC::Swap_SamePlayer).with_player(act.player1));
            if (bad_slot(act.init_pos1))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player1).with_position(act.init_pos1));
            if (bad_slot(act.init_pos2))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player2).with_position(act.init_pos2));
            // insertion index, one past the end is allowed
            if (act.final_pos1 > W)
                return std::unexpected(Viol(AVC::Swap_FinalPositionOutOfRange).with_player(act.player1)
                                       .with_position(act.final_pos1));
            if (act.final_pos2 > W)
                return std::unexpected(Viol(AVC::Swap_FinalPositionOutOfRange).with_player(act.player2)
                                       .with_position(act.final_pos2));
            if (st.IsRevealed(act.player1, act.init_pos1))
                return std::unexpected(Viol(AVC::Swap_RevealedWire).with_player(act.player1).with_position(act.init_pos1));
            if (st.IsRevealed(act.player2, act.init_pos2))
                return std::unexpected(Viol(AVC::Swap_RevealedWire).with_player(act.player2).with_position(act.init_pos2));
            if (act.received_value1 && !IndexOf(st, *act.received_value1))
                return std::unexpected(Viol(AVC::UnknownValue).with_value(*act.received_value1));
            if (act.received_value2 && !IndexOf(st, *act.received_value2))
                return std::unexpected(Viol(AVC::UnknownValue).with_value(*act.received_value2));

            if (strict && (act.player1 == me || act.player2 == me))
            {
                bool const first = act.player1 == me;
                std::optional<WireValue> const received = first ? act.received_value1 : act.received_value2;
                SlotIdxT const init = first ? act.init_pos1 : act.init_pos2;
                SlotIdxT const fin = first ? act.final_pos1 : act.final_pos2;
                if (!received)
                    return std::unexpected(Viol(AVC::Swap_MissingReceivedValue).with_player(me));

                // own hand must stay sorted once the received wire is in place
                std::vector<std::optional<ValueIdxT>> hand;
                for (SlotIdxT s{}; s < W; ++s)
                    if (s != init) hand.push_back(st.OwnWire(s));
                hand.insert(hand.begin() + EffectiveFinal(init, fin), IndexOf(st, *received));
                std::optional<ValueIdxT> prev{};
                for (std::optional<ValueIdxT> const& w : hand)
                {
                    if (!w) continue;
                    if (prev && *w < *prev)
                        return std::unexpected(Viol(AVC::Swap_OwnHandMismatch).with_player(me)
                                               .with_position(fin).with_value(*received));
                    prev = w;
                }
            }
            return {};
        }
        else if constexpr (std::is_same_v<T, HasValueRecord>)
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            std::optional<ValueIdxT> const v = IndexOf(st, act.value);
            if (!v)
                return std::unexpected(Viol(AVC::UnknownValue).with_value(act.value));
            if (strict && act.player == me && !OwnHolds(st, *v, false))
                return std::unexpected(Viol(AVC::HasValue_OwnHandMismatch)
                                       .with_player(act.player).with_value(act.value));
            return {};
        }
        else if constexpr (std::is_same_v<T, CopyCountSignalRecord>)
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            if (bad_slot(act.position))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position));
            if (act.copy_count < 1 || act.copy_count > W)
                return std::unexpected(Viol(AVC::CopyCount_OutOfRange)
                                       .with_player(act.player).with_count(act.copy_count));

            if (strict && act.player == me)
            {
                if (std::optional<ValueIdxT> const own = st.OwnWire(act.position))
                {
                    auto const held = std::ranges::count_if(std::views::iota(0, static_cast<int>(W)),
                        [&](int s) { return st.OwnWire(static_cast<SlotIdxT>(s)) == own; });
                    if (held != act.copy_count)
                        return std::unexpected(Viol(AVC::CopyCount_OwnHandMismatch)
                                               .with_player(act.player).with_position(act.position)
                                               .with_count(act.copy_count));
                }
            }
            return {};
        }
        else
        {
            if (bad_player(act.player))
                return std::unexpected(Viol(AVC::PlayerOutOfRange).with_player(act.player));
            if (bad_slot(act.position1))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position1));
            if (bad_slot(act.position2))
                return std::unexpected(Viol(AVC::PositionOutOfRange).with_player(act.player).with_position(act.position2));
            int const gap = static_cast<int>(act.position1) - static_cast<int>(act.position2);
            if (gap != 1 && gap != -1)
                return std::unexpected(Viol(AVC::Adjacent_NotAdjacent)
                                       .with_player(act.player).with_position(act.position1));

            if (strict && act.player == me)
            {
                std::optional<ValueIdxT> const a1 = st.OwnWire(act.position1);
                std::optional<ValueIdxT> const a2 = st.OwnWire(act.position2);
                if (a1 && a2 && ((*a1 == *a2) != act.is_equal))
                    return std::unexpected(Viol(AVC::Adjacent_OwnHandMismatch)
                                           .with_player(act.player).with_position(act.position1));
            }
            return {};
        }
    }, a);
}

auto BombRules::Apply(BeliefState& st, ActionRecord const& a) const -> void
{
    std::visit([&]<typename T0>(T0 const& act)
    {
        using T = std::decay_t<T0>;

        auto reveal = [&st](SlotRef at, ValueIdxT v)
        {
            st.Pin(at, v);
            if (!st.trackers_[v].AddRevealed(at))
                st.FlagContradiction(std::format("reveal of {} at P{}[{}] exceeds its copies",
                                                 st.Domain().Format(v), static_cast<int>(at.player),
                                                 static_cast<int>(at.slot)));
        };

        if constexpr (std::is_same_v<T, CallRecord>)
        {
            ValueIdxT const v = *st.Domain().IndexOf(act.value);
            if (act.success)
            {
                reveal({act.target, act.position}, v);
                if (act.caller_position)
                    reveal({act.caller, *act.caller_position}, v);
                return;
            }
            st.RemoveValue({act.target, act.position}, v);
            if (act.caller != st.me_ && !st.trackers_[v].AddCalled(act.caller))
                st.FlagContradiction(std::format("P{} called {} but every copy is accounted for",
                                                 static_cast<int>(act.caller), st.Domain().Format(v)));
        }
        else if constexpr (std::is_same_v<T, DoubleRevealRecord>)
        {
            ValueIdxT const v = *st.Domain().IndexOf(act.value);
            reveal({act.player, act.position1}, v);
            reveal({act.player, act.position2}, v);
        }
        else if constexpr (std::is_same_v<T, SignalRecord>)
        {
            ValueIdxT const v = *st.Domain().IndexOf(act.value);
            SlotRef const at{act.player, act.position};
            st.Pin(at, v);
            if (!st.trackers_[v].AddCertain(at))
                st.FlagContradiction(std::format("signal of {} at P{}[{}] exceeds its copies",
                                                 st.Domain().Format(v), static_cast<int>(at.player),
                                                 static_cast<int>(at.slot)));
        }
        else if constexpr (std::is_same_v<T, NotPresentRecord>)
        {
            ValueIdxT const v = *st.Domain().IndexOf(act.value);
            if (act.position)
            {
                st.RemoveValue({act.player, *act.position}, v);
                return;
            }
            for (SlotIdxT s{}; s < st.HandSize(); ++s)
                st.RemoveValue({act.player, s}, v);
        }
        else if constexpr (std::is_same_v<T, SwapRecord>)
        {
            ApplySwap(st, act);
        }
        else if constexpr (std::is_same_v<T, HasValueRecord>)
        {
            ValueIdxT const v = *st.Domain().IndexOf(act.value);
            if (act.player != st.me_ && !st.trackers_[v].AddCalled(act.player))
                st.FlagContradiction(std::format("P{} announced {} but every copy is accounted for",
                                                 static_cast<int>(act.player), st.Domain().Format(v)));
        }
        else if constexpr (std::is_same_v<T, CopyCountSignalRecord>)
        {
            CopyCountConstraint const c{act.player, act.position, act.copy_count};
            auto& list = st.constraints_.copy_counts;
            if (std::ranges::find(list, c) != list.end()) return;
            if (std::ranges::any_of(list, [&](CopyCountConstraint const& o)
                { return o.player == c.player && o.slot == c.slot; }))
                st.FlagContradiction(std::format("P{}[{}] signalled with two different copy counts",
                                                 static_cast<int>(c.player), static_cast<int>(c.slot)));
            list.push_back(c);
        }
        else
        {
            AdjacentConstraint const c{act.player, std::min(act.position1, act.position2), act.is_equal};
            auto& list = st.constraints_.adjacent;
            if (std::ranges::find(list, c) != list.end()) return;
            if (std::ranges::any_of(list, [&](AdjacentConstraint const& o)
                { return o.player == c.player && o.low == c.low; }))
                st.FlagContradiction(std::format("P{}[{}..{}] signalled both equal and different",
                                                 static_cast<int>(c.player), static_cast<int>(c.low),
                                                 static_cast<int>(c.low + 1)));
            list.push_back(c);
        }
    }, a);
}

    auto BombRules::ApplySwap(BeliefState& st, SwapRecord const& act) -> void
    {
        PlyrIdxT const p1 = act.player1;
        PlyrIdxT const p2 = act.player2;
        SlotIdxT const init1 = act.init_pos1;
        SlotIdxT const init2 = act.init_pos2;
        SlotIdxT const fin1 = BombRules::EffectiveFinal(init1, act.final_pos1);
        SlotIdxT const fin2 = BombRules::EffectiveFinal(init2, act.final_pos2);
        PlyrIdxT const me = st.Owner();

        ValueSet const out1 = st.grid_[p1][init1];
        ValueSet const out2 = st.grid_[p2][init2];

        // the owner sees the wire they receive
        std::optional<ValueIdxT> const recv1 =
            (p1 == me && act.received_value1) ? st.Domain().IndexOf(*act.received_value1) : std::nullopt;
        std::optional<ValueIdxT> const recv2 =
            (p2 == me && act.received_value2) ? st.Domain().IndexOf(*act.received_value2) : std::nullopt;

        ValueSet const in1 = recv1 ? ValueSet::Single(*recv1) : out2;
        ValueSet const in2 = recv2 ? ValueSet::Single(*recv2) : out1;

        auto move_wire = [](Hand& h, SlotIdxT init, SlotIdxT fin, ValueSet incoming)
        {
            h.erase(h.begin() + init);
            h.insert(h.begin() + fin, incoming);
        };
        move_wire(st.grid_[p1], init1, fin1, in1);
        move_wire(st.grid_[p2], init2, fin2, in2);

        if (p1 == me || p2 == me)
        {
            SlotIdxT const init = p1 == me ? init1 : init2;
            SlotIdxT const fin = p1 == me ? fin1 : fin2;
            std::optional<ValueIdxT> const recv = p1 == me ? recv1 : recv2;
            st.my_hand_.erase(st.my_hand_.begin() + init);
            st.my_hand_.insert(st.my_hand_.begin() + fin, recv);
        }

        auto remap = [&](SlotRef r) -> SlotRef
        {
            if (r.player == p1)
                return r.slot == init1 ? SlotRef{p2, fin2} : SlotRef{p1, BombRules::ShiftedPosition(r.slot, init1, fin1)};
            if (r.player == p2)
                return r.slot == init2 ? SlotRef{p1, fin1} : SlotRef{p2, BombRules::ShiftedPosition(r.slot, init2, fin2)};
            return r;
        };

        for (ValueTracker& t : st.trackers_)
        {
            std::vector<SlotRef> revealed;
            std::vector<SlotRef> certain;
            std::ranges::transform(t.Revealed(), std::back_inserter(revealed), remap);
            std::ranges::transform(t.Certain(), std::back_inserter(certain), remap);

            // the wire handed over may have been the demonstrated copy
            std::vector<PlyrIdxT> called;
            for (PlyrIdxT const p : t.Called())
            {
                if (p == p1 && out1.Contains(t.Value())) continue;
                if (p == p2 && out2.Contains(t.Value())) continue;
                called.push_back(p);
            }

            if (!t.Replace(std::move(revealed), std::move(certain), std::move(called)))
                st.FlagContradiction(std::format("swap left tracker {} inconsistent", st.Domain().Format(t.Value())));
        }

        for (auto const& [recv, at] : {std::pair{recv1, SlotRef{p1, fin1}}, std::pair{recv2, SlotRef{p2, fin2}}})
        {
            if (!recv) continue;
            if (!st.trackers_[*recv].AddCertain(at))
                st.FlagContradiction(std::format("received {} exceeds its copies", st.Domain().Format(*recv)));
        }

        // copy counts of a hand that just changed no longer hold
        std::erase_if(st.constraints_.copy_counts, [&](CopyCountConstraint const& c)
        {
            return c.player == p1 || c.player == p2;
        });

        std::vector<AdjacentConstraint> kept;
        for (AdjacentConstraint const& c : st.constraints_.adjacent)
        {
            if (c.player != p1 && c.player != p2)
            {
                kept.push_back(c);
                continue;
            }
            SlotIdxT const init = c.player == p1 ? init1 : init2;
            SlotIdxT const fin = c.player == p1 ? fin1 : fin2;
            if (c.low == init || c.low + 1 == init) continue;
            SlotIdxT const lo = BombRules::ShiftedPosition(c.low, init, fin);
            SlotIdxT const hi = BombRules::ShiftedPosition(static_cast<SlotIdxT>(c.low + 1), init, fin);
            if (hi == lo + 1)
                kept.push_back({c.player, lo, c.is_equal});
        }
        st.constraints_.adjacent = std::move(kept);
    }
}
