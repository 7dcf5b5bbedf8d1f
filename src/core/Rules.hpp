//
// Created by Malik T on 15/08/2025.
//

#ifndef LUDOPLUS_RULES_HPP
#define LUDOPLUS_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace ludo::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Never mutates; a rejected action leaves no trace.
        virtual auto Validate(GameState const& state, PlayerAction const& a) const -> CheckResult = 0;

        // Mutates a working copy. Only called after Validate succeeded; throws on broken invariants.
        virtual auto Apply(GameState& state, PlayerAction const& a) const -> void = 0;

        // Finishes the turn if Apply left the state in Cleanup.
        virtual auto Advance(GameState& state) const -> MoveOutcome = 0;
    };
}

#endif //LUDOPLUS_RULES_HPP
