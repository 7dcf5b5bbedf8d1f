//
// Created by Malik T on 01/10/2025.
//

#include "State.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include <fmt/format.h>

#include "Exception.hpp"
#include "Names.hpp"

namespace ludo::core
{
    namespace
    {
        constexpr std::array<Color, constants::ColorCount> SeatOrder{
            Color::Red, Color::Blue, Color::Green, Color::Yellow};

        auto SeatColors(Color human, uint32_t n) -> std::vector<Color>
        {
            std::vector<Color> colors{human};
            for (Color const c : SeatOrder)
            {
                if (c != human) colors.push_back(c);
            }
            colors.resize(n);
            return colors;
        }
    }

    auto GameState::FindPiece(PieceId id) const -> Piece const*
    {
        auto const it = std::ranges::find(pieces, id, &Piece::id);
        return it == pieces.end() ? nullptr : &*it;
    }

    auto GameState::FindPiece(PieceId id) -> Piece*
    {
        auto const it = std::ranges::find(pieces, id, &Piece::id);
        return it == pieces.end() ? nullptr : &*it;
    }

    auto GameState::HeroOf(PlyrIdxT seat) const -> Piece const*
    {
        auto const it = std::ranges::find_if(pieces, [seat](Piece const& p) { return p.owner == seat && p.IsHero(); });
        return it == pieces.end() ? nullptr : &*it;
    }

    auto GameState::PortalOwner(Position pos) const -> std::optional<Color>
    {
        for (size_t i{}; i < claimed_portals.size(); ++i)
        {
            if (claimed_portals[i] == pos) return static_cast<Color>(i);
        }
        return std::nullopt;
    }

    auto GameState::SeatOf(Color c) const -> std::optional<PlyrIdxT>
    {
        auto const it = std::ranges::find(players, c, &PlayerInfo::color);
        if (it == players.end()) return std::nullopt;
        return it->seat;
    }

    auto GameState::PiecesAt(Position pos) const -> std::vector<Piece const*>
    {
        std::vector<Piece const*> out;
        for (Piece const& p : pieces)
        {
            if (p.OnBoard() && *p.position == pos) out.push_back(&p);
        }
        return out;
    }

    auto MakeInitialState(Config const& cfg) -> GameState
    {
        if (cfg.n_players < constants::MinPlayers || cfg.n_players > constants::MaxPlayers)
            LUDO_THROW(error::Code::State, fmt::format("Unsupported player count {}", cfg.n_players));
        if (static_cast<size_t>(cfg.human_color) >= constants::ColorCount)
            LUDO_THROW(error::Code::State, fmt::format("Unknown color {}", static_cast<int>(cfg.human_color)));

        GameState s{};
        s.cfg = cfg;
        s.rng.seed(cfg.seed);

        std::vector<Color> const colors = SeatColors(cfg.human_color, cfg.n_players);
        for (PlyrIdxT seat{}; seat < colors.size(); ++seat)
        {
            PlayerInfo info{};
            info.seat = seat;
            info.color = colors[seat];
            info.name = cfg.hotseat ? std::string(to_string(colors[seat]))
                                    : (seat == 0 ? std::string("You") : fmt::format("CPU {}", seat));
            info.is_ai = cfg.hotseat ? false : seat > 0;
            s.players.push_back(std::move(info));

            Piece hero{};
            hero.id = s.next_piece_id++;
            hero.owner = seat;
            hero.color = colors[seat];
            hero.kind = Hero{};
            s.pieces.push_back(hero);

            s.hands.push_back(CreatePlayerHand(seat, s.next_card_id, s.rng));
            s.rosters.push_back(MakeRoster(seat));
        }

        s.current = 0;
        s.phase = Phase::SelectCard;
        // In hotseat mode the first player must explicitly start the turn
        s.turn_ready = !cfg.hotseat;
        return s;
    }
}
