//
// Created by Malik T on 14/08/2025.
//

#ifndef LUDOPLUS_PLAYER_HPP
#define LUDOPLUS_PLAYER_HPP

#include <memory>
#include <optional>

#include "Actions.hpp"
#include "State.hpp"

namespace ludo::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the game loop when this seat is to act.
        // nullopt means the policy has nothing to propose.
        virtual auto Play(std::shared_ptr<GameState const> state) -> std::optional<PlayerAction> = 0;
    };
}
#endif //LUDOPLUS_PLAYER_HPP
