//
// Created by Malik T on 15/08/2025.
//

#include "AuditLogger.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

using namespace bomb::core;

namespace
{

auto s_opt(std::optional<SlotIdxT> const& s) -> std::string
{
    return s ? std::format("{}", *s) : std::string("-");
}

auto s_opt(std::optional<WireValue> const& v) -> std::string
{
    return v ? std::format("{}", *v) : std::string("?");
}

auto s_slots(std::vector<SlotRef> const& v) -> std::string
{
    std::string body;
    for (size_t i{}; i < v.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("P{}[{}]", v[i].player, v[i].slot);
    }
    return body;
}

} // anonymous namespace

namespace bomb::core::debug
{

auto DescribeRecord(ActionRecord const& record) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& r) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, CallRecord>)
            {
                return std::format("Call P{}->P{}[{}]={} {} caller_pos={}", r.caller, r.target, r.position,
                                   r.value, (r.success ? "hit" : "miss"), s_opt(r.caller_position));
            }
            else if constexpr (std::is_same_v<T, DoubleRevealRecord>)
            {
                return std::format("DoubleReveal P{}[{},{}]={}", r.player, r.position1, r.position2, r.value);
            }
            else if constexpr (std::is_same_v<T, SignalRecord>)
            {
                return std::format("Signal P{}[{}]={}", r.player, r.position, r.value);
            }
            else if constexpr (std::is_same_v<T, NotPresentRecord>)
            {
                return std::format("NotPresent P{}[{}]!={}", r.player, s_opt(r.position), r.value);
            }
            else if constexpr (std::is_same_v<T, SwapRecord>)
            {
                return std::format("Swap P{}[{}->{}]<-{} P{}[{}->{}]<-{}",
                                   r.player1, r.init_pos1, r.final_pos1, s_opt(r.received_value1),
                                   r.player2, r.init_pos2, r.final_pos2, s_opt(r.received_value2));
            }
            else if constexpr (std::is_same_v<T, HasValueRecord>)
            {
                return std::format("HasValue P{} {}", r.player, r.value);
            }
            else if constexpr (std::is_same_v<T, CopyCountSignalRecord>)
            {
                return std::format("CopyCount P{}[{}] x{}", r.player, r.position, r.copy_count);
            }
            else
            {
                return std::format("Adjacent P{}[{},{}] {}", r.player, r.position1, r.position2,
                                   (r.is_equal ? "==" : "!="));
            }
        },
        record
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(BeliefState const& state, uint64_t seed) -> void
{
    ValueDomain const& dom = state.Domain();
    std::string deck;
    for (ValueIdxT v{}; v < dom.Size(); ++v)
        deck += std::format("{}{}x{}", (v ? "," : ""), dom.Format(v), dom.Copies(v));

    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Owner=P{}\n", state.Owner());
    out_ << std::format("Players={} HandSize={}\n", state.PlayerCount(), state.HandSize());
    out_ << std::format("Deck=[{}]\n", deck);
    out_ << std::format("GlobalSolver={}\n", (state.Solver() && state.Cfg().use_global_solver) ? "on" : "off");
    out_.flush();
}

auto AuditLogger::action(ActionRecord const& record, error::ValidateResult const& result) -> void
{
    out_ << std::format("Action: {}\n", DescribeRecord(record));
    out_ << std::format("Outcome: {}\n", result ? std::string("Applied")
                                                : std::format("Rejected ({})", error::describe(result.error())));
}

auto AuditLogger::grid(BeliefState const& state) -> void
{
    for (PlyrIdxT p{}; p < state.PlayerCount(); ++p)
    {
        std::string body;
        for (SlotIdxT s{}; s < state.HandSize(); ++s)
            body += std::format("{}{}", (s ? " " : ""), state.Domain().Format(state.Candidates(p, s)));
        out_ << std::format("  P{}: {}\n", p, body);
    }
}

auto AuditLogger::trackers(BeliefState const& state) -> void
{
    for (ValueTracker const& t : state.Trackers())
    {
        std::string called;
        for (size_t i{}; i < t.Called().size(); ++i)
            called += std::format("{}P{}", (i ? "," : ""), t.Called()[i]);

        out_ << std::format("  {}: revealed=[{}] certain=[{}] called=[{}] uncertain={}/{}\n",
                            state.Domain().Format(t.Value()), s_slots(t.Revealed()), s_slots(t.Certain()),
                            called, t.Uncertain(), t.Total());
    }
}

auto AuditLogger::end(BeliefState const& state) -> void
{
    int deduced = 0;
    for (PlyrIdxT p{}; p < state.PlayerCount(); ++p)
        deduced += state.IsFullyDeduced(p) ? 1 : 0;

    out_ << std::format("Consistent={}\n", state.IsConsistent());
    out_ << std::format("FullyDeduced={}\n", deduced);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace bomb::core::debug
