//
// Created by Malik T on 02/10/2025.
//

#ifndef LUDOPLUS_MOVERESOLVER_HPP
#define LUDOPLUS_MOVERESOLVER_HPP

#include <expected>
#include <optional>

#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ludo::core::resolve
{
    struct MoveResult
    {
        int start_index{};
        int target_index{};       // where the effective step count would land
        int final_index{};        // where the mover actually stops
        Position final_pos{};
        int steps{};              // effective, modifiers included

        std::optional<PieceId> interceptor{}; // set -> mover captured on final_pos
        std::optional<PieceId> captured{};    // occupant taken on the destination
        bool mover_removed{false};            // support gone: intercepted, assassin spent, reached center
        bool finished{false};                 // hero reached the center
    };

    // Card value plus escort (+1 each adjacent own escort, hero only) and assassin (+2) bonuses.
    auto EffectiveSteps(GameState const& s, Piece const& mover, int base) -> int;

    // Pure: computes what moving `mover` along `color`'s path would do.
    // Returns unexpected(reason) when the move is illegal.
    auto CalculateMove(GameState const& s, Piece const& mover, Color color, int base)
        -> std::expected<MoveResult, error::RuleViolation>;

    // Mutating helpers, used on a working copy after validation.
    // Hero -> reset home. Support -> erased, subtype recalled to its roster.
    // Returns a copy of the victim as it was before capture.
    auto CapturePiece(GameState& s, PieceId victim) -> Piece;
    auto SendHome(GameState& s, PieceId id) -> void;
    auto RemoveSupport(GameState& s, PieceId id) -> void;
}

#endif //LUDOPLUS_MOVERESOLVER_HPP
