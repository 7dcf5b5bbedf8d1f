//
// Created by Malik T on 14/08/2025.
//

#ifndef LUDOPLUS_STATE_HPP
#define LUDOPLUS_STATE_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Roster.hpp"

namespace ludo::core
{
    enum class LogAction : uint8_t
    {
        Moved,
        Entered,
        Finished,
        Captured,
        Skipped,
        Refreshed,
        Claimed,
        Stole,
        Summoned,
        HeroReset,
        SupportRemoved,
        AbilityUsed,
        Intercepted
    };

    inline auto to_string(LogAction a) -> std::string_view
    {
        switch (a)
        {
        case LogAction::Moved: return "moved";
        case LogAction::Entered: return "entered";
        case LogAction::Finished: return "finished";
        case LogAction::Captured: return "captured";
        case LogAction::Skipped: return "skipped";
        case LogAction::Refreshed: return "refreshed";
        case LogAction::Claimed: return "claimed";
        case LogAction::Stole: return "stole";
        case LogAction::Summoned: return "summoned";
        case LogAction::HeroReset: return "hero_reset";
        case LogAction::SupportRemoved: return "support_removed";
        case LogAction::AbilityUsed: return "ability_used";
        case LogAction::Intercepted: return "intercepted";
        }
        return "?";
    }

    struct LogEntry
    {
        uint32_t id{};
        PlyrIdxT actor{};
        std::string player_name;
        Color player_color{};
        LogAction action{};
        std::optional<uint8_t> card_value{};
        std::optional<std::string> target_player{};
        std::optional<PieceKind> piece{};
        std::optional<PieceKind> target_piece{};

        auto operator==(LogEntry const&) const -> bool = default;
    };

    // The whole game as one value. Transitions copy it; nothing is shared between snapshots.
    struct GameState
    {
        Config cfg{};
        std::vector<PlayerInfo> players;
        std::vector<Piece> pieces;
        std::vector<Hand> hands;              // [seat]
        std::vector<SupportRoster> rosters;   // [seat]

        PlyrIdxT current{};
        Phase phase{Phase::SelectCard};
        std::optional<Card> selected_card{};
        std::optional<PlyrIdxT> winner{};
        std::vector<LogEntry> log;            // append-only
        bool turn_ready{true};

        std::array<std::optional<Position>, constants::ColorCount> claimed_portals{}; // [color]
        std::optional<Position> pending_portal{};
        std::optional<PieceId> ability_piece{};
        bool pusher_used{false};

        RngT rng{};
        CardId next_card_id{1};
        PieceId next_piece_id{1};
        uint32_t next_log_id{1};

        auto operator==(GameState const&) const -> bool = default;

        //returns nullptr if doesnt exist
        [[nodiscard]] auto FindPiece(PieceId id) const -> Piece const*;
        [[nodiscard]] auto FindPiece(PieceId id) -> Piece*;
        [[nodiscard]] auto HeroOf(PlyrIdxT seat) const -> Piece const*;

        [[nodiscard]] auto CurrentPlayer() const -> PlayerInfo const& { return players.at(current); }
        [[nodiscard]] auto PortalOf(Color c) const -> std::optional<Position> { return claimed_portals[static_cast<size_t>(c)]; }
        // color owning the portal on pos, if any
        [[nodiscard]] auto PortalOwner(Position pos) const -> std::optional<Color>;
        [[nodiscard]] auto SeatOf(Color c) const -> std::optional<PlyrIdxT>;

        // On-board, unfinished pieces standing on pos.
        [[nodiscard]] auto PiecesAt(Position pos) const -> std::vector<Piece const*>;
        [[nodiscard]] auto PlayerCount() const noexcept -> size_t { return players.size(); }
    };

    // Throws error::StateError for a player count outside [2, 4].
    auto MakeInitialState(Config const& cfg) -> GameState;
}

#endif //LUDOPLUS_STATE_HPP
