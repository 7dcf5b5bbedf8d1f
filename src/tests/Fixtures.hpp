//
// Created by Malik T on 09/10/2025.
//

#ifndef LUDOPLUS_TEST_FIXTURES_HPP
#define LUDOPLUS_TEST_FIXTURES_HPP

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../core/Board.hpp"
#include "../core/Game.hpp"
#include "../core/Queries.hpp"
#include "../core/StandardRules.hpp"
#include "../core/State.hpp"
#include "../debug/Invariants.hpp"

namespace ludo::test
{
    using namespace ludo::core;

    // Seat 0 is Red (hero p1), seat 1 is Blue (hero p2), ...
    inline auto MakeState(uint32_t n = 2, uint64_t seed = 42, bool hotseat = false) -> GameState
    {
        Config cfg{};
        cfg.n_players = n;
        cfg.seed = seed;
        cfg.hotseat = hotseat;
        return MakeInitialState(cfg);
    }

    inline auto HeroOf(GameState const& s, PlyrIdxT seat) -> Piece const&
    {
        return *s.HeroOf(seat);
    }

    // Puts a piece on `pos`, path index taken from its own color's path.
    inline auto PlaceAt(GameState& s, PieceId id, Position pos) -> void
    {
        Piece* p = s.FindPiece(id);
        ASSERT_NE(p, nullptr);
        p->position = pos;
        p->path_index = board::IndexOnPath(p->color, pos);
        p->finished = false;
    }

    inline auto PlaceAtIndex(GameState& s, PieceId id, int idx) -> void
    {
        Piece const* p = s.FindPiece(id);
        ASSERT_NE(p, nullptr);
        PlaceAt(s, id, *board::PositionFor(p->color, idx));
    }

    // Deploys a support straight onto the board, bypassing the summon rules.
    inline auto AddSupport(GameState& s, PlyrIdxT seat, SupportType t, Position pos) -> PieceId
    {
        Piece piece{};
        piece.id = s.next_piece_id++;
        piece.owner = seat;
        piece.color = s.players.at(seat).color;
        piece.kind = Support{t};
        piece.position = pos;
        piece.path_index = board::IndexOnPath(piece.color, pos);
        s.rosters.at(seat) = Deploy(s.rosters.at(seat), t, piece.id);
        s.pieces.push_back(piece);
        return piece.id;
    }

    inline auto AddSupportAtIndex(GameState& s, PlyrIdxT seat, SupportType t, int idx) -> PieceId
    {
        return AddSupport(s, seat, t, *board::PositionFor(s.players.at(seat).color, idx));
    }

    // Rewrites the current player's first card and selects it.
    inline auto ForceCard(GameState& s, uint8_t value) -> Card
    {
        Card& c = s.hands.at(s.current).cards.front();
        c.value = value;
        s.selected_card = c;
        s.phase = Phase::SelectAction;
        return c;
    }

    inline auto RunAction(GameState const& s, PlayerAction const& a) -> Transition
    {
        static StandardRules const rules{};
        return Transit(rules, s, a);
    }

    inline auto ExpectRejected(GameState const& s, PlayerAction const& a, error::RuleViolationCode code) -> void
    {
        Transition const t = RunAction(s, a);
        EXPECT_EQ(t.outcome, MoveOutcome::Invalid);
        ASSERT_TRUE(t.violation.has_value());
        EXPECT_EQ(t.violation->code, code) << error::describe(*t.violation);
        EXPECT_EQ(t.state, s) << "a rejected action must leave the state untouched";
    }

    inline auto ExpectConsistent(GameState const& s) -> void
    {
        std::vector<std::string> const broken = debug::CollectViolations(s);
        EXPECT_TRUE(broken.empty()) << fmt::format("{}", fmt::join(broken, "\n"));
    }

    inline auto LastLog(GameState const& s) -> LogEntry const&
    {
        return s.log.back();
    }

    inline auto CountLog(GameState const& s, LogAction a) -> long
    {
        return std::ranges::count(s.log, a, &LogEntry::action);
    }
}

#endif //LUDOPLUS_TEST_FIXTURES_HPP
