//
// Created by Malik T on 15/08/2025.
//

#ifndef LUDOPLUS_STANDARDRULES_HPP
#define LUDOPLUS_STANDARDRULES_HPP
#include "Rules.hpp"

namespace ludo::core
{
    class StandardRules final : public Rules
    {
    public:
        auto Validate(GameState const& state, PlayerAction const& a) const -> CheckResult override;
        auto Apply(GameState& state, PlayerAction const& a) const -> void override;
        auto Advance(GameState& state) const -> MoveOutcome override;

        // Next seat in fixed order; resets every per-turn field.
        static auto EndTurn(GameState& state) -> void;
    };
}

#endif //LUDOPLUS_STANDARDRULES_HPP
