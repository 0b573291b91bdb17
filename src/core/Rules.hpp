//
// Created by Malik T on 15/08/2025.
//

#ifndef BOMBBUSTER_RULES_HPP
#define BOMBBUSTER_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace bomb::core
{
    //forward declaration
    class BeliefState;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for malformed or impossible records (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(BeliefState const& state, ActionRecord const& a) const -> CheckResult = 0;

        // Translate a validated record into candidate set and tracker edits.
        virtual auto Apply(BeliefState& state, ActionRecord const& a) const -> void = 0;
    };
}

#endif //BOMBBUSTER_RULES_HPP
