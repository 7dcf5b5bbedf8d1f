//
// Codec.cpp
//
#include "Codec.hpp"

#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace gb = ::ludo::gen::bridge;

namespace ludo::core::bridge
{
    auto ToFbColor(Color c) noexcept -> gb::Color
    {
        switch (c)
        {
        case Color::Red: return gb::Color::Red;
        case Color::Blue: return gb::Color::Blue;
        case Color::Green: return gb::Color::Green;
        case Color::Yellow: return gb::Color::Yellow;
        }
        return gb::Color::Red;
    }

    auto FromFbColor(gb::Color c) noexcept -> Color
    {
        switch (c)
        {
        case gb::Color::Red: return Color::Red;
        case gb::Color::Blue: return Color::Blue;
        case gb::Color::Green: return Color::Green;
        case gb::Color::Yellow: return Color::Yellow;
        }
        return Color::Red;
    }

    auto ToFbSupport(SupportType t) noexcept -> gb::SupportType
    {
        switch (t)
        {
        case SupportType::Escort: return gb::SupportType::Escort;
        case SupportType::Blocker: return gb::SupportType::Blocker;
        case SupportType::Assassin: return gb::SupportType::Assassin;
        case SupportType::Pusher: return gb::SupportType::Pusher;
        }
        return gb::SupportType::Escort;
    }

    auto FromFbSupport(gb::SupportType t) noexcept -> SupportType
    {
        switch (t)
        {
        case gb::SupportType::Escort: return SupportType::Escort;
        case gb::SupportType::Blocker: return SupportType::Blocker;
        case gb::SupportType::Assassin: return SupportType::Assassin;
        case gb::SupportType::Pusher: return SupportType::Pusher;
        }
        return SupportType::Escort;
    }

    auto ToFbPhase(Phase p) noexcept -> gb::Phase
    {
        switch (p)
        {
        case Phase::SelectCard: return gb::Phase::SelectCard;
        case Phase::SelectAction: return gb::Phase::SelectAction;
        case Phase::PortalChoice: return gb::Phase::PortalChoice;
        case Phase::SelectPushTarget: return gb::Phase::SelectPushTarget;
        case Phase::Cleanup: return gb::Phase::Cleanup;
        case Phase::GameOver: return gb::Phase::GameOver;
        }
        return gb::Phase::SelectCard;
    }

    auto FromFbPhase(gb::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case gb::Phase::SelectCard: return Phase::SelectCard;
        case gb::Phase::SelectAction: return Phase::SelectAction;
        case gb::Phase::PortalChoice: return Phase::PortalChoice;
        case gb::Phase::SelectPushTarget: return Phase::SelectPushTarget;
        case gb::Phase::Cleanup: return Phase::Cleanup;
        case gb::Phase::GameOver: return Phase::GameOver;
        }
        return Phase::SelectCard;
    }

    auto ToFbPieceType(PieceKind const& k) noexcept -> gb::PieceType
    {
        std::optional<SupportType> const t = std::holds_alternative<Support>(k)
                                                 ? std::optional{std::get<Support>(k).type}
                                                 : std::nullopt;
        if (!t) return gb::PieceType::Hero;
        switch (*t)
        {
        case SupportType::Escort: return gb::PieceType::Escort;
        case SupportType::Blocker: return gb::PieceType::Blocker;
        case SupportType::Assassin: return gb::PieceType::Assassin;
        case SupportType::Pusher: return gb::PieceType::Pusher;
        }
        return gb::PieceType::None;
    }

    auto ToFbLogAction(LogAction a) noexcept -> gb::LogAction
    {
        // declared in the same order on both sides
        return static_cast<gb::LogAction>(static_cast<uint8_t>(a));
    }
}

namespace
{
    // Verify enum layouts (first and last value per enum catch drift)
    static_assert((int)ludo::core::Color::Yellow == (int)gb::Color::Yellow);
    static_assert((int)ludo::core::SupportType::Pusher == (int)gb::SupportType::Pusher);
    static_assert((int)ludo::core::Phase::GameOver == (int)gb::Phase::GameOver);
    static_assert((int)ludo::core::LogAction::Moved == (int)gb::LogAction::Moved);
    static_assert((int)ludo::core::LogAction::Intercepted == (int)gb::LogAction::Intercepted);

    inline auto ToFbCell(ludo::core::Position p) -> gb::Cell
    {
        return gb::Cell(p.row, p.col);
    }

    template <typename E>
    inline auto InRange(E e) -> bool
    {
        return static_cast<int>(e) >= static_cast<int>(E::MIN) && static_cast<int>(e) <= static_cast<int>(E::MAX);
    }

    inline auto Wrap(flatbuffers::FlatBufferBuilder& fbb, uint64_t msg_id, ludo::core::PlyrIdxT actor,
                     gb::Action type, flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const m = gb::CreateActionMsg(fbb, msg_id, actor, type, body);
        auto const e = gb::CreateEnvelope(fbb, gb::Message::ActionMsg, m.Union());
        fbb.Finish(e);
        return fbb.Release();
    }
} // anonymous

namespace ludo::core::bridge
{
    // ---------- Snapshot (engine -> UI) ----------

    auto BuildSnapshot(GameState const& s, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        // Seats
        std::vector<flatbuffers::Offset<gb::Seat>> seats;
        seats.reserve(s.players.size());
        for (PlayerInfo const& p : s.players)
        {
            auto const name = fbb.CreateString(p.name);
            seats.push_back(gb::CreateSeat(fbb, p.seat, ToFbColor(p.color), name, p.is_ai));
        }
        auto const seats_vec = fbb.CreateVector(seats);

        // Pieces
        std::vector<flatbuffers::Offset<gb::Piece>> pieces;
        pieces.reserve(s.pieces.size());
        for (Piece const& p : s.pieces)
        {
            gb::Cell const cell = p.position ? ToFbCell(*p.position) : gb::Cell{};
            pieces.push_back(gb::CreatePiece(
                fbb,
                /*id*/ p.id,
                /*owner*/ p.owner,
                /*color*/ ToFbColor(p.color),
                /*kind*/ ToFbPieceType(p.kind),
                /*cell*/ p.position ? &cell : nullptr,
                /*path_index*/ static_cast<int8_t>(p.path_index),
                /*finished*/ p.finished));
        }
        auto const pieces_vec = fbb.CreateVector(pieces);

        // Hands
        std::vector<flatbuffers::Offset<gb::Hand>> hands;
        hands.reserve(s.hands.size());
        for (Hand const& h : s.hands)
        {
            std::vector<flatbuffers::Offset<gb::Card>> cards;
            cards.reserve(h.cards.size());
            for (Card const& c : h.cards)
            {
                cards.push_back(gb::CreateCard(fbb, c.id, c.value));
            }
            auto const cards_vec = fbb.CreateVector(cards);
            hands.push_back(gb::CreateHand(fbb, h.owner, cards_vec,
                                           static_cast<uint8_t>(h.deck.size()),
                                           static_cast<uint8_t>(h.discard.size())));
        }
        auto const hands_vec = fbb.CreateVector(hands);

        // Rosters
        std::vector<flatbuffers::Offset<gb::Roster>> rosters;
        rosters.reserve(s.rosters.size());
        for (SupportRoster const& r : s.rosters)
        {
            std::vector<uint8_t> available;
            for (SupportType const t : r.available) available.push_back(static_cast<uint8_t>(ToFbSupport(t)));
            std::vector<uint8_t> lost;
            for (SupportType const t : r.lost) lost.push_back(static_cast<uint8_t>(ToFbSupport(t)));

            auto const a_vec = fbb.CreateVector(available);
            auto const f_vec = fbb.CreateVector(r.on_field);
            auto const l_vec = fbb.CreateVector(lost);
            rosters.push_back(gb::CreateRoster(fbb, r.owner, a_vec, f_vec, l_vec));
        }
        auto const rosters_vec = fbb.CreateVector(rosters);

        // Portals
        std::vector<flatbuffers::Offset<gb::Portal>> portals;
        for (size_t i{}; i < s.claimed_portals.size(); ++i)
        {
            if (!s.claimed_portals[i]) continue;
            gb::Cell const cell = ToFbCell(*s.claimed_portals[i]);
            portals.push_back(gb::CreatePortal(fbb, ToFbColor(static_cast<Color>(i)), &cell));
        }
        auto const portals_vec = fbb.CreateVector(portals);

        // Log
        std::vector<flatbuffers::Offset<gb::LogLine>> lines;
        lines.reserve(s.log.size());
        for (LogEntry const& e : s.log)
        {
            auto const player = fbb.CreateString(e.player_name);
            flatbuffers::Offset<flatbuffers::String> target{};
            if (e.target_player) target = fbb.CreateString(*e.target_player);

            lines.push_back(gb::CreateLogLine(
                fbb,
                /*id*/ e.id,
                /*actor*/ e.actor,
                /*player*/ player,
                /*color*/ ToFbColor(e.player_color),
                /*action*/ ToFbLogAction(e.action),
                /*card_value*/ e.card_value.value_or(0),
                /*target_player*/ target,
                /*piece*/ e.piece ? ToFbPieceType(*e.piece) : gb::PieceType::None,
                /*target_piece*/ e.target_piece ? ToFbPieceType(*e.target_piece) : gb::PieceType::None));
        }
        auto const log_vec = fbb.CreateVector(lines);

        flatbuffers::Offset<gb::Card> selected{};
        if (s.selected_card) selected = gb::CreateCard(fbb, s.selected_card->id, s.selected_card->value);

        gb::Cell const pending = s.pending_portal ? ToFbCell(*s.pending_portal) : gb::Cell{};

        auto const view = gb::CreateGameView(
            fbb,
            /*schema_version*/ 1,
            /*n_players*/ static_cast<uint8_t>(s.PlayerCount()),
            /*current*/ s.current,
            /*phase*/ ToFbPhase(s.phase),
            /*turn_ready*/ s.turn_ready,
            /*hotseat*/ s.cfg.hotseat,
            /*selected_card*/ selected,
            /*winner*/ s.winner ? static_cast<int8_t>(*s.winner) : int8_t{-1},
            /*players*/ seats_vec,
            /*pieces*/ pieces_vec,
            /*hands*/ hands_vec,
            /*rosters*/ rosters_vec,
            /*portals*/ portals_vec,
            /*pending_portal*/ s.pending_portal ? &pending : nullptr,
            /*ability_piece*/ s.ability_piece.value_or(0),
            /*pusher_used*/ s.pusher_used,
            /*log*/ log_vec
        );

        auto const sm = gb::CreateSnapshotMsg(fbb, msg_id, view);
        auto const env = gb::CreateEnvelope(fbb, gb::Message::SnapshotMsg, sm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Violation (engine -> UI) ----------

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = gb::CreateViolation(fbb, msg_id, static_cast<uint16_t>(v.code), txt);
        auto const env = gb::CreateEnvelope(fbb, gb::Message::Violation, vio.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Actions (UI -> engine) ----------

    auto BuildAction(PlyrIdxT actor, PlayerAction const& a, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectCardAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_SelectCard,
                            gb::CreateAction_SelectCard(fbb, act.card_id).Union());
            else if constexpr (std::is_same_v<T, UnselectCardAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_UnselectCard,
                            gb::CreateAction_UnselectCard(fbb).Union());
            else if constexpr (std::is_same_v<T, EnterPieceAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_EnterPiece,
                            gb::CreateAction_EnterPiece(fbb, act.piece_id, act.use_portal).Union());
            else if constexpr (std::is_same_v<T, MovePieceAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_MovePiece,
                            gb::CreateAction_MovePiece(fbb, act.piece_id).Union());
            else if constexpr (std::is_same_v<T, ClaimPortalAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_ClaimPortal,
                            gb::CreateAction_ClaimPortal(fbb).Union());
            else if constexpr (std::is_same_v<T, SkipPortalAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_SkipPortal,
                            gb::CreateAction_SkipPortal(fbb).Union());
            else if constexpr (std::is_same_v<T, StealPortalAction>)
            {
                gb::Cell const cell = ToFbCell(act.position);
                return Wrap(fbb, msg_id, actor, gb::Action::Action_StealPortal,
                            gb::CreateAction_StealPortal(fbb, &cell).Union());
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_EndTurn,
                            gb::CreateAction_EndTurn(fbb).Union());
            else if constexpr (std::is_same_v<T, StartTurnAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_StartTurn,
                            gb::CreateAction_StartTurn(fbb).Union());
            else if constexpr (std::is_same_v<T, RefreshHandAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_RefreshHand,
                            gb::CreateAction_RefreshHand(fbb).Union());
            else if constexpr (std::is_same_v<T, ResetGameAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_ResetGame,
                            gb::CreateAction_ResetGame(fbb, static_cast<uint8_t>(act.player_count),
                                                       ToFbColor(act.human_color), act.hotseat).Union());
            else if constexpr (std::is_same_v<T, SummonSupportAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_SummonSupport,
                            gb::CreateAction_SummonSupport(fbb, ToFbSupport(act.type), act.use_portal).Union());
            else if constexpr (std::is_same_v<T, ActivatePusherAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_ActivatePusher,
                            gb::CreateAction_ActivatePusher(fbb, act.piece_id).Union());
            else if constexpr (std::is_same_v<T, ExecutePushAction>)
                return Wrap(fbb, msg_id, actor, gb::Action::Action_ExecutePush,
                            gb::CreateAction_ExecutePush(fbb, act.target_id).Union());
            else
                return Wrap(fbb, msg_id, actor, gb::Action::Action_CancelAbility,
                            gb::CreateAction_CancelAbility(fbb).Union());
        }, a);
    }

    // ---------- Decode (engine <- inbound wire) ----------

    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>
    {
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!gb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        auto const* env = gb::GetEnvelope(data);
        if (env->message_type() != gb::Message::ActionMsg)
            return std::unexpected(ParseError{"not an ActionMsg"});

        auto const* msg = env->message_as_ActionMsg();
        if (!msg || (msg->action_type() != gb::Action::NONE && !msg->action()))
            return std::unexpected(ParseError{"ActionMsg without a body"});

        DecodedAction out{};
        out.msg_id = msg->msg_id();
        out.actor = static_cast<PlyrIdxT>(msg->actor());

        switch (msg->action_type())
        {
        case gb::Action::Action_SelectCard:
            out.action = SelectCardAction{msg->action_as_Action_SelectCard()->card_id()};
            break;
        case gb::Action::Action_UnselectCard:
            out.action = UnselectCardAction{};
            break;
        case gb::Action::Action_EnterPiece:
        {
            auto const* a = msg->action_as_Action_EnterPiece();
            out.action = EnterPieceAction{a->piece_id(), a->use_portal()};
            break;
        }
        case gb::Action::Action_MovePiece:
            out.action = MovePieceAction{msg->action_as_Action_MovePiece()->piece_id()};
            break;
        case gb::Action::Action_ClaimPortal:
            out.action = ClaimPortalAction{};
            break;
        case gb::Action::Action_SkipPortal:
            out.action = SkipPortalAction{};
            break;
        case gb::Action::Action_StealPortal:
        {
            gb::Cell const* cell = msg->action_as_Action_StealPortal()->cell();
            if (!cell)
                return std::unexpected(ParseError{"StealPortal without a cell"});
            out.action = StealPortalAction{Position{cell->row(), cell->col()}};
            break;
        }
        case gb::Action::Action_EndTurn:
            out.action = EndTurnAction{};
            break;
        case gb::Action::Action_StartTurn:
            out.action = StartTurnAction{};
            break;
        case gb::Action::Action_RefreshHand:
            out.action = RefreshHandAction{};
            break;
        case gb::Action::Action_ResetGame:
        {
            auto const* a = msg->action_as_Action_ResetGame();
            if (!InRange(a->human_color()))
                return std::unexpected(ParseError{"unknown color"});
            ResetGameAction r{};
            r.player_count = a->player_count();
            r.human_color = FromFbColor(a->human_color());
            r.hotseat = a->hotseat();
            out.action = r;
            break;
        }
        case gb::Action::Action_SummonSupport:
        {
            auto const* a = msg->action_as_Action_SummonSupport();
            if (!InRange(a->support()))
                return std::unexpected(ParseError{"unknown support type"});
            out.action = SummonSupportAction{FromFbSupport(a->support()), a->use_portal()};
            break;
        }
        case gb::Action::Action_ActivatePusher:
            out.action = ActivatePusherAction{msg->action_as_Action_ActivatePusher()->piece_id()};
            break;
        case gb::Action::Action_ExecutePush:
            out.action = ExecutePushAction{msg->action_as_Action_ExecutePush()->target_id()};
            break;
        case gb::Action::Action_CancelAbility:
            out.action = CancelAbilityAction{};
            break;
        default:
            return std::unexpected(ParseError{"unknown action type"});
        }
        return out;
    }
} // namespace ludo::core::bridge
