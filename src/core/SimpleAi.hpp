//
// Created by Malik T on 05/10/2025.
//

#ifndef LUDOPLUS_SIMPLEAI_HPP
#define LUDOPLUS_SIMPLEAI_HPP

#include "Player.hpp"

namespace ludo::core
{
    // First-fit priority policy:
    // claim pending portals, select the first card, then move > enter (portal first) > summon > refresh.
    class SimpleAI final : public Player
    {
    public:
        auto Play(std::shared_ptr<GameState const> state) -> std::optional<PlayerAction> override;

        // Stateless core, usable without a shared snapshot.
        static auto Decide(GameState const& s) -> std::optional<PlayerAction>;
    };
}

#endif //LUDOPLUS_SIMPLEAI_HPP
