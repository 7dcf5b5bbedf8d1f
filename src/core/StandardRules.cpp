//
// Created by Malik T on 15/08/2025.
//

#include "StandardRules.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "Board.hpp"
#include "MoveResolver.hpp"
#include "Queries.hpp"

namespace
{
    inline auto Viol(ludo::core::error::RuleViolationCode code) -> ludo::core::error::RuleViolation
    {
        return ludo::core::error::RuleViolation{ .code = code };
    }
}

namespace ludo::core
{
    using RVC = ::ludo::core::error::RuleViolationCode;

    static auto InTurnPhase(Phase p) -> bool
    {
        return p == Phase::SelectCard || p == Phase::SelectAction;
    }

    // Appends a log line for `actor`; the caller fills in the optional columns.
    static auto Log(GameState& s, PlyrIdxT actor, LogAction action) -> LogEntry&
    {
        PlayerInfo const& who = s.players.at(actor);
        LogEntry e{};
        e.id = s.next_log_id++;
        e.actor = actor;
        e.player_name = who.name;
        e.player_color = who.color;
        e.action = action;
        s.log.push_back(std::move(e));
        return s.log.back();
    }

    // Logs the fate of a piece taken off the board by a capture.
    static auto LogLoss(GameState& s, Piece const& victim) -> void
    {
        LogEntry& e = Log(s, victim.owner, victim.IsHero() ? LogAction::HeroReset : LogAction::SupportRemoved);
        e.piece = victim.kind;
    }

    static auto LogCapture(GameState& s, PlyrIdxT actor, PieceKind const& by, Piece const& victim) -> void
    {
        LogEntry& e = Log(s, actor, LogAction::Captured);
        e.target_player = s.players.at(victim.owner).name;
        e.piece = by;
        e.target_piece = victim.kind;
    }

    // Plays the selected card and draws a replacement. Returns the value played.
    static auto ConsumeSelectedCard(GameState& s) -> uint8_t
    {
        LUDO_ASSERT(s.selected_card.has_value(), "Consuming a card with none selected");
        Card const card = *s.selected_card;
        Hand& hand = s.hands.at(s.current);
        hand = DrawCard(PlayCard(std::move(hand), card.id), s.rng);
        s.selected_card.reset();
        return card.value;
    }

    static auto CheckOwnPiece(GameState const& s, PieceId id) -> std::expected<Piece const*, error::RuleViolation>
    {
        Piece const* p = s.FindPiece(id);
        if (!p)
            return std::unexpected(Viol(RVC::UnknownPiece).with_piece(id));
        if (p->owner != s.current)
            return std::unexpected(Viol(RVC::NotOwnPiece).with_piece(id).with_actor(s.current));
        return p;
    }

    auto StandardRules::Validate(GameState const& s, PlayerAction const& a) const -> CheckResult
    {
        // Reset is a meta action: legal from any phase
        if (auto const* reset = std::get_if<ResetGameAction>(&a))
        {
            if (reset->player_count < constants::MinPlayers || reset->player_count > constants::MaxPlayers)
                return std::unexpected(Viol(RVC::Reset_BadPlayerCount));
            if (static_cast<size_t>(reset->human_color) >= constants::ColorCount)
                return std::unexpected(Viol(RVC::Reset_BadColor));
            return {};
        }

        if (s.phase == Phase::GameOver)
            return std::unexpected(Viol(RVC::GameAlreadyOver).with_phase(s.phase));

        PlyrIdxT const actor = s.current;

        if (!s.turn_ready && !std::holds_alternative<StartTurnAction>(a))
            return std::unexpected(Viol(RVC::TurnNotStarted).with_actor(actor).with_phase(s.phase));

        auto const require_select_action = [&]() -> CheckResult
        {
            if (s.phase != Phase::SelectAction)
                return std::unexpected(Viol(RVC::WrongPhase_SelectActionRequired)
                                       .with_phase(s.phase).with_actor(actor));
            if (!s.selected_card)
                return std::unexpected(Viol(RVC::NoCardSelected).with_actor(actor));
            return {};
        };

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectCardAction>)
            {
                if (!InTurnPhase(s.phase))
                    return std::unexpected(Viol(RVC::WrongPhase_CardSelectionRequired)
                                           .with_phase(s.phase).with_actor(actor));
                if (!FindCard(s.hands.at(actor), act.card_id))
                    return std::unexpected(Viol(RVC::Select_CardNotInHand).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, UnselectCardAction>)
            {
                if (s.phase != Phase::SelectAction)
                    return std::unexpected(Viol(RVC::WrongPhase_SelectActionRequired)
                                           .with_phase(s.phase).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, EnterPieceAction>)
            {
                if (auto const ok = require_select_action(); !ok) return ok;

                auto const found = CheckOwnPiece(s, act.piece_id);
                if (!found) return std::unexpected(found.error());
                Piece const& hero = **found;

                if (!hero.IsHero())
                    return std::unexpected(Viol(RVC::Enter_NotHero).with_piece(hero.id));
                if (hero.position || hero.finished)
                    return std::unexpected(Viol(RVC::Enter_NotAtHome).with_piece(hero.id));

                if (act.use_portal)
                {
                    std::optional<Position> const portal = s.PortalOf(hero.color);
                    if (!portal)
                        return std::unexpected(Viol(RVC::Enter_NoPortal).with_piece(hero.id));
                    if (!s.PiecesAt(*portal).empty())
                        return std::unexpected(Viol(RVC::Enter_PortalOccupied)
                                               .with_piece(hero.id).with_position(*portal));
                    return {};
                }

                Position const start = board::EntryPosition(hero.color);
                std::vector<Piece const*> const at_start = s.PiecesAt(start);
                if (at_start.size() >= constants::MaxPiecesPerCell)
                    return std::unexpected(Viol(RVC::Enter_StartAtCapacity)
                                           .with_piece(hero.id).with_position(start)
                                           .with_occupants(static_cast<uint8_t>(at_start.size())));
                if (std::ranges::any_of(at_start, [&](Piece const* p) { return p->owner != actor; }))
                    return std::unexpected(Viol(RVC::Enter_StartHeldByOpponent)
                                           .with_piece(hero.id).with_position(start));
                return {};
            }
            else if constexpr (std::is_same_v<T, MovePieceAction>)
            {
                if (auto const ok = require_select_action(); !ok) return ok;

                auto const found = CheckOwnPiece(s, act.piece_id);
                if (!found) return std::unexpected(found.error());
                Piece const& mover = **found;

                auto const r = resolve::CalculateMove(s, mover, mover.color, s.selected_card->value);
                if (!r)
                    return std::unexpected(error::RuleViolation{r.error()}
                                           .with_actor(actor).with_card(s.selected_card->value));
                return {};
            }
            else if constexpr (std::is_same_v<T, ClaimPortalAction> || std::is_same_v<T, SkipPortalAction>)
            {
                if (s.phase != Phase::PortalChoice)
                    return std::unexpected(Viol(RVC::WrongPhase_PortalChoiceRequired)
                                           .with_phase(s.phase).with_actor(actor));
                if (!s.pending_portal)
                    return std::unexpected(Viol(RVC::Portal_NothingPending).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, StealPortalAction>)
            {
                if (s.phase != Phase::SelectAction)
                    return std::unexpected(Viol(RVC::WrongPhase_SelectActionRequired)
                                           .with_phase(s.phase).with_actor(actor));

                std::optional<Color> const owner = s.PortalOwner(act.position);
                if (!owner)
                    return std::unexpected(Viol(RVC::Steal_NotAClaimedPortal).with_position(act.position));
                if (*owner == s.CurrentPlayer().color)
                    return std::unexpected(Viol(RVC::Steal_OwnPortal).with_position(act.position));

                // some piece of another color must be standing on the portal
                std::vector<Piece const*> const on_portal = s.PiecesAt(act.position);
                if (std::ranges::none_of(on_portal, [&](Piece const* p) { return p->color != *owner; }))
                    return std::unexpected(Viol(RVC::Steal_NoOpposingPieceOnPortal)
                                           .with_actor(actor).with_position(act.position));
                return {};
            }
            else if constexpr (std::is_same_v<T, EndTurnAction> || std::is_same_v<T, RefreshHandAction>)
            {
                if (!InTurnPhase(s.phase))
                    return std::unexpected(Viol(RVC::WrongPhase_CardSelectionRequired)
                                           .with_phase(s.phase).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, StartTurnAction>)
            {
                if (s.turn_ready)
                    return std::unexpected(Viol(RVC::Start_AlreadyReady).with_actor(actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, ResetGameAction>)
            {
                return {}; // handled above
            }
            else if constexpr (std::is_same_v<T, SummonSupportAction>)
            {
                if (auto const ok = require_select_action(); !ok) return ok;

                SupportRoster const& roster = s.rosters.at(actor);
                if (!IsAvailable(roster, act.type))
                    return std::unexpected(Viol(RVC::Summon_NotAvailable).with_support(act.type).with_actor(actor));
                if (!HasFieldRoom(roster))
                    return std::unexpected(Viol(RVC::Summon_FieldFull).with_support(act.type).with_actor(actor));

                if (act.use_portal)
                {
                    bool const strong_card = s.selected_card->value >= constants::PortalMinCardValue;
                    if (!strong_card || !s.PortalOf(s.CurrentPlayer().color))
                        return std::unexpected(Viol(RVC::Summon_PortalNotAllowed)
                                               .with_support(act.type).with_card(s.selected_card->value));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, ActivatePusherAction>)
            {
                if (!InTurnPhase(s.phase))
                    return std::unexpected(Viol(RVC::WrongPhase_CardSelectionRequired)
                                           .with_phase(s.phase).with_actor(actor));
                if (s.pusher_used)
                    return std::unexpected(Viol(RVC::Pusher_AlreadyUsed).with_actor(actor));

                auto const found = CheckOwnPiece(s, act.piece_id);
                if (!found) return std::unexpected(found.error());
                Piece const& pusher = **found;
                if (!pusher.IsSupport(SupportType::Pusher) || !pusher.OnBoard())
                    return std::unexpected(Viol(RVC::Pusher_NotOwnPusher).with_piece(pusher.id));
                return {};
            }
            else if constexpr (std::is_same_v<T, ExecutePushAction>)
            {
                if (s.phase != Phase::SelectPushTarget)
                    return std::unexpected(Viol(RVC::WrongPhase_PushTargetRequired)
                                           .with_phase(s.phase).with_actor(actor));
                if (!s.ability_piece)
                    return std::unexpected(Viol(RVC::Push_NoActivePusher).with_actor(actor));

                std::vector<PieceId> const targets = query::GetPushTargets(s, *s.ability_piece);
                if (std::ranges::find(targets, act.target_id) == targets.end())
                    return std::unexpected(Viol(RVC::Push_InvalidTarget).with_piece(act.target_id));
                return {};
            }
            else if constexpr (std::is_same_v<T, CancelAbilityAction>)
            {
                if (s.phase != Phase::SelectPushTarget)
                    return std::unexpected(Viol(RVC::WrongPhase_PushTargetRequired)
                                           .with_phase(s.phase).with_actor(actor));
                return {};
            }

            LUDO_THROW(error::Code::Unknown, "Unreachable variant in Validate");
        }, a);
    }

    static auto ApplyMove(GameState& s, PieceId mover_id) -> void
    {
        Piece const mover = *s.FindPiece(mover_id);
        PlyrIdxT const actor = s.current;
        uint8_t const value = s.selected_card->value;

        auto const calc = resolve::CalculateMove(s, mover, mover.color, value);
        if (!calc)
            LUDO_THROW(error::Code::Rules, fmt::format("Applying an illegal move: {}", error::describe(calc.error())));
        resolve::MoveResult const& r = *calc;

        ConsumeSelectedCard(s);

        if (r.interceptor)
        {
            Piece const blocker = *s.FindPiece(*r.interceptor);
            LogEntry& e = Log(s, actor, LogAction::Intercepted);
            e.card_value = value;
            e.target_player = s.players.at(blocker.owner).name;
            e.piece = mover.kind;
            e.target_piece = blocker.kind;

            LogLoss(s, resolve::CapturePiece(s, mover.id));
            s.phase = Phase::Cleanup;
            return;
        }

        {
            Piece* p = s.FindPiece(mover.id);
            p->position = r.final_pos;
            p->path_index = r.final_index;
            p->finished = r.finished;
        }
        {
            LogEntry& e = Log(s, actor, r.finished ? LogAction::Finished : LogAction::Moved);
            e.card_value = value;
            e.piece = mover.kind;
        }

        if (r.captured)
        {
            Piece const victim = resolve::CapturePiece(s, *r.captured);
            LogCapture(s, actor, mover.kind, victim);
            LogLoss(s, victim);
        }

        if (r.finished)
        {
            s.winner = actor;
            s.phase = Phase::GameOver;
            return;
        }

        if (r.mover_removed)
        {
            resolve::RemoveSupport(s, mover.id);
            LogLoss(s, mover);
            s.phase = Phase::Cleanup;
            return;
        }

        // Landing on an unclaimed portal
        if (board::IsSummon(r.final_pos) && !s.PortalOwner(r.final_pos))
        {
            Color const mine = s.CurrentPlayer().color;
            if (!s.PortalOf(mine))
            {
                s.claimed_portals[static_cast<size_t>(mine)] = r.final_pos;
                Log(s, actor, LogAction::Claimed);
            }
            else
            {
                s.pending_portal = r.final_pos;
                s.phase = Phase::PortalChoice;
                return;
            }
        }
        s.phase = Phase::Cleanup;
    }

    static auto ApplyPush(GameState& s, PieceId target_id) -> void
    {
        PlyrIdxT const actor = s.current;
        Piece const pusher = *s.FindPiece(*s.ability_piece);
        Piece const target = *s.FindPiece(target_id);

        std::optional<Position> const dest = board::PushDestination(*pusher.position, *target.position);
        LUDO_ASSERT(dest.has_value(), "Push target without a destination");

        {
            LogEntry& e = Log(s, actor, LogAction::AbilityUsed);
            e.target_player = s.players.at(target.owner).name;
            e.piece = pusher.kind;
            e.target_piece = target.kind;
        }

        // whoever stood on the destination is taken by the arriving piece
        std::vector<PieceId> victims;
        for (Piece const* p : s.PiecesAt(*dest))
        {
            if (p->id != target.id) victims.push_back(p->id);
        }
        for (PieceId const id : victims)
        {
            Piece const victim = resolve::CapturePiece(s, id);
            LogCapture(s, actor, target.kind, victim);
            LogLoss(s, victim);
        }

        s.pusher_used = true;
        s.ability_piece.reset();

        if (board::IsCenter(*dest))
        {
            if (target.IsHero())
            {
                Piece* p = s.FindPiece(target.id);
                p->position = *dest;
                p->path_index = constants::CenterIndex;
                p->finished = true;
                LogEntry& e = Log(s, target.owner, LogAction::Finished);
                e.piece = target.kind;

                s.winner = target.owner;
                s.phase = Phase::GameOver;
                return;
            }
            resolve::RemoveSupport(s, target.id);
            LogLoss(s, target);
        }
        else
        {
            int const idx = board::IndexOnPath(target.color, *dest);
            LUDO_ASSERT(idx >= 0, "Push destination is not on the target's path");
            Piece* p = s.FindPiece(target.id);
            p->position = *dest;
            p->path_index = idx;
        }

        s.phase = s.selected_card ? Phase::SelectAction : Phase::SelectCard;
    }

    auto StandardRules::Apply(GameState& s, PlayerAction const& a) const -> void
    {
        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                PlyrIdxT const actor = s.current;

                if constexpr (std::is_same_v<T, SelectCardAction>)
                {
                    s.selected_card = FindCard(s.hands.at(actor), act.card_id);
                    s.phase = Phase::SelectAction;
                }
                else if constexpr (std::is_same_v<T, UnselectCardAction>)
                {
                    s.selected_card.reset();
                    s.phase = Phase::SelectCard;
                }
                else if constexpr (std::is_same_v<T, EnterPieceAction>)
                {
                    Piece* hero = s.FindPiece(act.piece_id);
                    Position const at = act.use_portal ? *s.PortalOf(hero->color) : board::EntryPosition(hero->color);
                    hero->position = at;
                    hero->path_index = board::IndexOnPath(hero->color, at);
                    LUDO_ASSERT(hero->path_index >= 0, "Entry cell is not on the hero's path");

                    uint8_t const value = ConsumeSelectedCard(s);
                    LogEntry& e = Log(s, actor, LogAction::Entered);
                    e.card_value = value;
                    e.piece = PieceKind{Hero{}};
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, MovePieceAction>)
                {
                    ApplyMove(s, act.piece_id);
                }
                else if constexpr (std::is_same_v<T, ClaimPortalAction>)
                {
                    s.claimed_portals[static_cast<size_t>(s.CurrentPlayer().color)] = *s.pending_portal;
                    s.pending_portal.reset();
                    Log(s, actor, LogAction::Claimed);
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, SkipPortalAction>)
                {
                    s.pending_portal.reset();
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, StealPortalAction>)
                {
                    Color const victim = *s.PortalOwner(act.position);
                    s.claimed_portals[static_cast<size_t>(victim)].reset();
                    s.claimed_portals[static_cast<size_t>(s.CurrentPlayer().color)] = act.position;

                    LogEntry& e = Log(s, actor, LogAction::Stole);
                    if (std::optional<PlyrIdxT> const seat = s.SeatOf(victim))
                        e.target_player = s.players.at(*seat).name;
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, EndTurnAction>)
                {
                    Log(s, actor, LogAction::Skipped);
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, StartTurnAction>)
                {
                    s.turn_ready = true;
                }
                else if constexpr (std::is_same_v<T, RefreshHandAction>)
                {
                    Hand& hand = s.hands.at(actor);
                    hand = RefreshHand(std::move(hand), s.rng);
                    s.selected_card.reset();
                    Log(s, actor, LogAction::Refreshed);
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, ResetGameAction>)
                {
                    Config cfg = s.cfg;
                    cfg.n_players = act.player_count;
                    cfg.human_color = act.human_color;
                    cfg.hotseat = act.hotseat;
                    cfg.seed = s.rng();
                    s = MakeInitialState(cfg);
                }
                else if constexpr (std::is_same_v<T, SummonSupportAction>)
                {
                    Color const color = s.CurrentPlayer().color;
                    Position const at = act.use_portal ? *s.PortalOf(color) : board::EntryPosition(color);

                    Piece piece{};
                    piece.id = s.next_piece_id++;
                    piece.owner = actor;
                    piece.color = color;
                    piece.kind = Support{act.type};
                    piece.position = at;
                    piece.path_index = board::IndexOnPath(color, at);
                    LUDO_ASSERT(piece.path_index >= 0, "Summon cell is not on the owner's path");

                    s.rosters.at(actor) = Deploy(std::move(s.rosters.at(actor)), act.type, piece.id);
                    s.pieces.push_back(piece);

                    uint8_t const value = ConsumeSelectedCard(s);
                    LogEntry& e = Log(s, actor, LogAction::Summoned);
                    e.card_value = value;
                    e.piece = piece.kind;
                    s.phase = Phase::Cleanup;
                }
                else if constexpr (std::is_same_v<T, ActivatePusherAction>)
                {
                    s.ability_piece = act.piece_id;
                    s.phase = Phase::SelectPushTarget;
                }
                else if constexpr (std::is_same_v<T, ExecutePushAction>)
                {
                    ApplyPush(s, act.target_id);
                }
                else if constexpr (std::is_same_v<T, CancelAbilityAction>)
                {
                    s.ability_piece.reset();
                    s.phase = s.selected_card ? Phase::SelectAction : Phase::SelectCard;
                }
            }, a);
    }

    auto StandardRules::EndTurn(GameState& s) -> void
    {
        LUDO_ASSERT(!s.players.empty(), "Ending a turn with no players");
        s.current = static_cast<PlyrIdxT>((s.current + 1) % s.players.size());
        s.phase = Phase::SelectCard;
        s.selected_card.reset();
        s.pending_portal.reset();
        s.ability_piece.reset();
        s.pusher_used = false;
        // hotseat humans must explicitly start their turn; AI seats never wait
        s.turn_ready = !s.cfg.hotseat || s.CurrentPlayer().is_ai;
    }

    auto StandardRules::Advance(GameState& s) const -> MoveOutcome
    {
        if (s.phase == Phase::GameOver)
            return MoveOutcome::GameEnded;
        if (s.phase != Phase::Cleanup)
            return MoveOutcome::Applied;

        EndTurn(s);
        return MoveOutcome::TurnEnded;
    }
}
