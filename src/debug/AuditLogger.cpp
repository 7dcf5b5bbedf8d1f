#include "AuditLogger.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "../core/Names.hpp"

using namespace ludo::core;

namespace
{

auto s_pos(Position const p) -> std::string
{
    return fmt::format("({},{})", static_cast<int>(p.row), static_cast<int>(p.col));
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectCardAction>)
                return fmt::format("SelectCard(#{})", act.card_id);
            else if constexpr (std::is_same_v<T, EnterPieceAction>)
                return fmt::format("Enter(p{}{})", act.piece_id, act.use_portal ? ",portal" : "");
            else if constexpr (std::is_same_v<T, MovePieceAction>)
                return fmt::format("Move(p{})", act.piece_id);
            else if constexpr (std::is_same_v<T, StealPortalAction>)
                return fmt::format("Steal{}", s_pos(act.position));
            else if constexpr (std::is_same_v<T, ResetGameAction>)
                return fmt::format("Reset(n={},{}{})", act.player_count, to_string(act.human_color),
                                   act.hotseat ? ",hotseat" : "");
            else if constexpr (std::is_same_v<T, SummonSupportAction>)
                return fmt::format("Summon({}{})", to_string(act.type), act.use_portal ? ",portal" : "");
            else if constexpr (std::is_same_v<T, ActivatePusherAction>)
                return fmt::format("Activate(p{})", act.piece_id);
            else if constexpr (std::is_same_v<T, ExecutePushAction>)
                return fmt::format("Push(p{})", act.target_id);
            else
                return std::string(to_string(PlayerAction{act}));
        },
        a
    );
}

auto serialize_pieces(GameState const& s) -> std::string
{
    std::string serial;
    bool first = true;

    for (Piece const& p : s.pieces)
    {
        serial += (first ? "" : ",");
        first = false;

        std::string where = p.finished ? "F" : (p.position ? fmt::format("{}@{}", p.path_index, s_pos(*p.position)) : "H");
        serial += fmt::format("p{}:{}:{}:{}", p.id, static_cast<int>(p.owner), to_string(p.kind), where);
    }

    return serial;
}

} // anonymous namespace

namespace ludo::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& s, uint64_t seed) -> void
{
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Players={}\n", static_cast<int>(s.PlayerCount()));
    for (PlayerInfo const& p : s.players)
    {
        out_ << fmt::format("Seat {} {} {}{}\n", static_cast<int>(p.seat), to_string(p.color), p.name,
                            p.is_ai ? " (ai)" : "");
    }
    out_.flush();
}

auto AuditLogger::turn(GameState const& s, PlayerAction const& a) -> void
{
    out_ << fmt::format(
        "Turn actor=P{} phase={} card={} pieces=[{}]\n",
        static_cast<int>(s.current),
        to_string(s.phase),
        s.selected_card ? static_cast<int>(s.selected_card->value) : 0,
        serialize_pieces(s)
    );

    out_ << fmt::format("Action: {}\n", s_action(a));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied       ? "Applied" :
        (m == MoveOutcome::TurnEnded     ? "TurnEnded" :
        (m == MoveOutcome::GameEnded     ? "GameEnded" :
        (m == MoveOutcome::AwaitingInput ? "AwaitingInput" : "Invalid"))));
    out_ << fmt::format("Outcome: {}\n", txt);
}

auto AuditLogger::events(GameState const& s, std::size_t from) -> void
{
    for (std::size_t i = from; i < s.log.size(); ++i)
    {
        LogEntry const& e = s.log[i];
        out_ << fmt::format("  #{} {} {}", e.id, e.player_name, to_string(e.action));
        if (e.piece) out_ << fmt::format(" {}", to_string(*e.piece));
        if (e.card_value) out_ << fmt::format(" card={}", static_cast<int>(*e.card_value));
        if (e.target_player) out_ << fmt::format(" vs {}", *e.target_player);
        if (e.target_piece) out_ << fmt::format(" ({})", to_string(*e.target_piece));
        out_ << '\n';
    }
}

auto AuditLogger::end(GameState const& s) -> void
{
    int const winner = s.winner ? static_cast<int>(*s.winner) : -1;
    out_ << fmt::format("Winner={}\n", winner);
    out_ << fmt::format("LogLines={}\n", s.log.size());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace ludo::core::debug
