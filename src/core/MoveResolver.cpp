//
// Created by Malik T on 02/10/2025.
//

#include "MoveResolver.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

#include "Board.hpp"

namespace
{
    inline auto Viol(ludo::core::error::RuleViolationCode code) -> ludo::core::error::RuleViolation
    {
        return ludo::core::error::RuleViolation{ .code = code };
    }
}

namespace ludo::core::resolve
{
    using RVC = ::ludo::core::error::RuleViolationCode;

    static auto IsOpposingBlocker(Piece const& p, PlyrIdxT mover_owner) -> bool
    {
        return p.owner != mover_owner && p.IsSupport(SupportType::Blocker);
    }

    auto EffectiveSteps(GameState const& s, Piece const& mover, int base) -> int
    {
        int steps = base;
        if (mover.IsHero() && mover.OnBoard())
        {
            auto const escorts = std::ranges::count_if(s.pieces, [&](Piece const& p)
            {
                return p.owner == mover.owner && p.IsSupport(SupportType::Escort) && p.OnBoard()
                    && board::AreAdjacent(*p.position, *mover.position);
            });
            steps += static_cast<int>(escorts) * constants::EscortBonus;
        }
        if (mover.IsSupport(SupportType::Assassin))
        {
            steps += constants::AssassinBonus;
        }
        return steps;
    }

    auto CalculateMove(GameState const& s, Piece const& mover, Color color, int base)
        -> std::expected<MoveResult, error::RuleViolation>
    {
        if (mover.finished)
            return std::unexpected(Viol(RVC::Move_PieceFinished).with_piece(mover.id));
        if (!mover.position || mover.path_index < 0)
            return std::unexpected(Viol(RVC::Move_NotOnBoard).with_piece(mover.id));

        MoveResult r{};
        r.start_index = mover.path_index;
        r.steps = EffectiveSteps(s, mover, base);
        r.target_index = r.start_index + r.steps;

        // center must be hit exactly
        if (r.target_index > constants::CenterIndex)
            return std::unexpected(Viol(RVC::Move_Overshoot)
                                   .with_piece(mover.id).with_from(r.start_index).with_steps(r.steps));

        // Interception: intermediate cells only
        for (int i = r.start_index + 1; i < r.target_index; ++i)
        {
            Position const cell = *board::PositionFor(color, i);
            for (Piece const* p : s.PiecesAt(cell))
            {
                if (p->id == mover.id || !IsOpposingBlocker(*p, mover.owner)) continue;
                r.final_index = i;
                r.final_pos = cell;
                r.interceptor = p->id;
                r.mover_removed = !mover.IsHero();
                return r;
            }
        }

        Position const target = *board::PositionFor(color, r.target_index);
        r.final_index = r.target_index;
        r.final_pos = target;

        std::vector<Piece const*> occupants = s.PiecesAt(target);
        std::erase_if(occupants, [&](Piece const* p) { return p->id == mover.id; });

        if (occupants.size() >= constants::MaxPiecesPerCell)
            return std::unexpected(Viol(RVC::Move_CellAtCapacity)
                                   .with_piece(mover.id).with_position(target)
                                   .with_occupants(static_cast<uint8_t>(occupants.size())));

        if (std::ranges::any_of(occupants, [&](Piece const* p) { return p->owner == mover.owner; }))
            return std::unexpected(Viol(RVC::Move_OwnPieceOnTarget).with_piece(mover.id).with_position(target));

        if (!occupants.empty())
        {
            Piece const& occupant = *occupants.front();
            // safe cells shelter heroes only; the two share the cell
            bool const sheltered = board::IsSafe(target) && occupant.IsHero();
            if (!sheltered) r.captured = occupant.id;
        }

        bool const at_center = r.target_index == constants::CenterIndex;
        if (mover.IsHero())
        {
            r.finished = at_center;
        }
        else
        {
            bool const assassin_spent = mover.IsSupport(SupportType::Assassin) && r.captured.has_value();
            r.mover_removed = assassin_spent || at_center;
        }
        return r;
    }

    auto SendHome(GameState& s, PieceId id) -> void
    {
        Piece* p = s.FindPiece(id);
        LUDO_ASSERT(p != nullptr, "Sending home a piece that does not exist");
        LUDO_ASSERT(p->IsHero(), "Only heroes are sent home");
        p->position.reset();
        p->path_index = -1;
        p->finished = false;
    }

    auto RemoveSupport(GameState& s, PieceId id) -> void
    {
        auto const it = std::ranges::find(s.pieces, id, &Piece::id);
        LUDO_ASSERT(it != s.pieces.end(), "Removing a piece that does not exist");
        std::optional<SupportType> const type = it->SupportKind();
        LUDO_ASSERT(type.has_value(), "Heroes are never removed");

        PlyrIdxT const owner = it->owner;
        s.pieces.erase(it);
        s.rosters.at(owner) = Recall(std::move(s.rosters.at(owner)), *type, id, s.cfg.recycle_fallen_supports);
    }

    auto CapturePiece(GameState& s, PieceId victim) -> Piece
    {
        Piece const* p = s.FindPiece(victim);
        LUDO_ASSERT(p != nullptr, "Capturing a piece that does not exist");
        Piece const before = *p;
        if (before.IsHero())
            SendHome(s, victim);
        else
            RemoveSupport(s, victim);
        return before;
    }
}
