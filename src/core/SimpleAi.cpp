//
// Created by Malik T on 05/10/2025.
//

#include "SimpleAi.hpp"

#include "Queries.hpp"

namespace ludo::core
{
    auto SimpleAI::Play(std::shared_ptr<GameState const> state) -> std::optional<PlayerAction>
    {
        return Decide(*state);
    }

    auto SimpleAI::Decide(GameState const& s) -> std::optional<PlayerAction>
    {
        if (s.phase == Phase::GameOver) return std::nullopt;
        if (!s.turn_ready) return StartTurnAction{};

        switch (s.phase)
        {
        case Phase::PortalChoice:
            return ClaimPortalAction{};
        case Phase::SelectPushTarget:
            return CancelAbilityAction{};
        case Phase::SelectCard:
        {
            Hand const& hand = s.hands.at(s.current);
            if (hand.cards.empty()) return RefreshHandAction{};
            return SelectCardAction{hand.cards.front().id};
        }
        case Phase::SelectAction:
            break;
        case Phase::Cleanup:
        case Phase::GameOver:
            return std::nullopt;
        }

        if (!s.selected_card) return RefreshHandAction{};

        // 1. pieces already on the board
        for (Piece const& p : s.pieces)
        {
            if (p.owner != s.current || !p.OnBoard()) continue;
            if (query::GetValidMoves(s, p.id).can_move) return MovePieceAction{p.id};
        }

        // 2. the hero from home, portal preferred
        for (Piece const& p : s.pieces)
        {
            if (p.owner != s.current || p.position || p.finished) continue;
            query::ValidMoves const v = query::GetValidMoves(s, p.id);
            if (v.can_enter_portal) return EnterPieceAction{p.id, true};
            if (v.can_enter_start) return EnterPieceAction{p.id, false};
        }

        // 3. first summonable support, through the portal when allowed
        for (SupportType const t : query::GetCurrentRoster(s).available)
        {
            query::SummonCheck const c = query::CanSummonSupport(s, t);
            if (c.can_use_portal) return SummonSupportAction{t, true};
            if (c.can_summon) return SummonSupportAction{t, false};
        }

        return RefreshHandAction{};
    }
}
