//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"

#include <algorithm>
#include <iterator>
#include <variant>

#include "Queries.hpp"

namespace ludo::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(rng_seed) {}

    auto RandomAI::IsPassive(GameState const& s, PlayerAction const& a) -> bool
    {
        return std::visit([&]<typename T0>(T0 const& act) -> bool
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, SelectCardAction>)
                return s.phase == Phase::SelectAction; // re-selection
            else if constexpr (std::is_same_v<T, ActivatePusherAction>)
                return query::GetPushTargets(s, act.piece_id).empty(); // would only cancel
            else
                return std::is_same_v<T, UnselectCardAction>
                    || std::is_same_v<T, EndTurnAction>
                    || std::is_same_v<T, RefreshHandAction>
                    || std::is_same_v<T, CancelAbilityAction>;
        }, a);
    }

    auto RandomAI::Play(std::shared_ptr<GameState const> state) -> std::optional<PlayerAction>
    {
        GameState const& s = *state;
        std::vector<PlayerAction> legal = query::LegalActions(s);
        if (legal.empty()) return std::nullopt;

        std::vector<PlayerAction> active;
        std::ranges::copy_if(legal, std::back_inserter(active),
                             [&](PlayerAction const& a) { return !IsPassive(s, a); });
        if (!active.empty()) return active[pick(active)];

        // only passive choices left; never bounce between select and unselect
        std::erase_if(legal, [](PlayerAction const& a)
        {
            return std::holds_alternative<UnselectCardAction>(a) || std::holds_alternative<SelectCardAction>(a)
                || std::holds_alternative<ActivatePusherAction>(a);
        });
        if (legal.empty()) return std::nullopt;
        return legal[pick(legal)];
    }
}
