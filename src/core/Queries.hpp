//
// Created by Malik T on 04/10/2025.
//

#ifndef LUDOPLUS_QUERIES_HPP
#define LUDOPLUS_QUERIES_HPP

#include <vector>

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

// Read-only views over a GameState for UI and AI consumers. Nothing here mutates.
namespace ludo::core::query
{
    struct ValidMoves
    {
        bool can_move{false};
        bool can_enter_start{false};
        bool can_enter_portal{false};
    };

    struct StealablePortal
    {
        Position position{};
        Color owner{};
    };

    struct SummonCheck
    {
        bool can_summon{false};
        bool can_use_portal{false};
    };

    // What the current player could do with `piece_id` and the selected card.
    auto GetValidMoves(GameState const& s, PieceId piece_id) -> ValidMoves;

    // Portals the current player may steal right now.
    auto GetStealablePortals(GameState const& s) -> std::vector<StealablePortal>;

    // Steps the piece would travel with the selected card; 0 without one.
    auto GetEffectiveMoveDistance(GameState const& s, PieceId piece_id) -> int;

    auto GetCurrentRoster(GameState const& s) -> SupportRoster const&;

    // Non-finished pieces of any owner adjacent to the pusher that have an on-path destination.
    auto GetPushTargets(GameState const& s, PieceId pusher_id) -> std::vector<PieceId>;

    auto CanSummonSupport(GameState const& s, SupportType type) -> SummonCheck;

    // Every action the reducer would accept for the current player, RESET_GAME excluded.
    auto LegalActions(GameState const& s) -> std::vector<PlayerAction>;
}

#endif //LUDOPLUS_QUERIES_HPP
