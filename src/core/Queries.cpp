//
// Created by Malik T on 04/10/2025.
//

#include "Queries.hpp"

#include <algorithm>
#include <ranges>

#include "Board.hpp"
#include "MoveResolver.hpp"
#include "StandardRules.hpp"

namespace ludo::core::query
{
    static auto Accepts(GameState const& s, PlayerAction const& a) -> bool
    {
        static StandardRules const rules{};
        return rules.Validate(s, a).has_value();
    }

    auto GetValidMoves(GameState const& s, PieceId piece_id) -> ValidMoves
    {
        ValidMoves v{};
        v.can_move = Accepts(s, MovePieceAction{piece_id});
        v.can_enter_start = Accepts(s, EnterPieceAction{piece_id, false});
        v.can_enter_portal = Accepts(s, EnterPieceAction{piece_id, true});
        return v;
    }

    auto GetStealablePortals(GameState const& s) -> std::vector<StealablePortal>
    {
        std::vector<StealablePortal> out;
        for (Position const pos : board::SummonPositions())
        {
            std::optional<Color> const owner = s.PortalOwner(pos);
            if (!owner) continue;
            if (Accepts(s, StealPortalAction{pos})) out.push_back({pos, *owner});
        }
        return out;
    }

    auto GetEffectiveMoveDistance(GameState const& s, PieceId piece_id) -> int
    {
        Piece const* p = s.FindPiece(piece_id);
        if (!p || !s.selected_card) return 0;
        return resolve::EffectiveSteps(s, *p, s.selected_card->value);
    }

    auto GetCurrentRoster(GameState const& s) -> SupportRoster const&
    {
        return s.rosters.at(s.current);
    }

    auto GetPushTargets(GameState const& s, PieceId pusher_id) -> std::vector<PieceId>
    {
        std::vector<PieceId> out;
        Piece const* pusher = s.FindPiece(pusher_id);
        if (!pusher || !pusher->IsSupport(SupportType::Pusher) || !pusher->OnBoard()) return out;

        for (Piece const& p : s.pieces)
        {
            if (p.id == pusher->id || !p.OnBoard()) continue;
            if (!board::AreAdjacent(*pusher->position, *p.position)) continue;
            if (!board::PushDestination(*pusher->position, *p.position)) continue;
            out.push_back(p.id);
        }
        return out;
    }

    auto CanSummonSupport(GameState const& s, SupportType type) -> SummonCheck
    {
        SummonCheck c{};
        c.can_summon = Accepts(s, SummonSupportAction{type, false});
        c.can_use_portal = Accepts(s, SummonSupportAction{type, true});
        return c;
    }

    auto LegalActions(GameState const& s) -> std::vector<PlayerAction>
    {
        std::vector<PlayerAction> candidates;
        switch (s.phase)
        {
        case Phase::SelectCard:
        case Phase::SelectAction:
            if (s.current < s.hands.size())
            {
                for (Card const& c : s.hands[s.current].cards)
                    candidates.emplace_back(SelectCardAction{c.id});
            }
            candidates.emplace_back(UnselectCardAction{});
            for (Piece const& p : s.pieces)
            {
                if (p.owner != s.current) continue;
                candidates.emplace_back(MovePieceAction{p.id});
                candidates.emplace_back(EnterPieceAction{p.id, false});
                candidates.emplace_back(EnterPieceAction{p.id, true});
                candidates.emplace_back(ActivatePusherAction{p.id});
            }
            for (SupportType const t : AllSupportTypes)
            {
                candidates.emplace_back(SummonSupportAction{t, false});
                candidates.emplace_back(SummonSupportAction{t, true});
            }
            for (Position const pos : board::SummonPositions())
                candidates.emplace_back(StealPortalAction{pos});
            candidates.emplace_back(RefreshHandAction{});
            candidates.emplace_back(EndTurnAction{});
            break;
        case Phase::PortalChoice:
            candidates.emplace_back(ClaimPortalAction{});
            candidates.emplace_back(SkipPortalAction{});
            break;
        case Phase::SelectPushTarget:
            if (s.ability_piece)
            {
                for (PieceId const id : GetPushTargets(s, *s.ability_piece))
                    candidates.emplace_back(ExecutePushAction{id});
            }
            candidates.emplace_back(CancelAbilityAction{});
            break;
        case Phase::Cleanup:
        case Phase::GameOver:
            break;
        }
        candidates.emplace_back(StartTurnAction{});

        std::vector<PlayerAction> out;
        for (PlayerAction const& a : candidates)
        {
            if (Accepts(s, a)) out.push_back(a);
        }
        return out;
    }
}
