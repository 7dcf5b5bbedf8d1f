//
// Created by Malik T on 18/08/2025.
//

#ifndef LUDOPLUS_RANDOMAI_HPP
#define LUDOPLUS_RANDOMAI_HPP

#include <random>
#include <vector>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ludo::core
{
    // Uniform over the actions the reducer would accept, biased away from
    // passive choices (re-selecting, skipping) while anything else is legal.
    class RandomAI final : public ludo::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto Play(std::shared_ptr<GameState const> state) -> std::optional<PlayerAction> override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        static auto IsPassive(GameState const& s, PlayerAction const& a) -> bool;

    private:
        std::mt19937 rng_;
    };
}

#endif //LUDOPLUS_RANDOMAI_HPP
