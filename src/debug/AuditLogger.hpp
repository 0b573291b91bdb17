//
// Created by Malik T on 20/08/2025.
//

#ifndef BOMBBUSTER_AUDITLOGGER_HPP
#define BOMBBUSTER_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Actions.hpp"
#include "../core/BeliefState.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace bomb::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, owner, deck, player count)
        auto start(BeliefState const& state, std::uint64_t seed) -> void;

        // One record and what Process made of it
        auto action(ActionRecord const& record, error::ValidateResult const& result) -> void;

        // Candidate grid, one line per player
        auto grid(BeliefState const& state) -> void;

        // Per value: revealed/certain/called/uncertain
        auto trackers(BeliefState const& state) -> void;

        // Footer (consistency flag, fully deduced players)
        auto end(BeliefState const& state) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto DescribeRecord(ActionRecord const& record) -> std::string;
}

#endif //BOMBBUSTER_AUDITLOGGER_HPP
