//
// Created by Malik T on 19/08/2025.
//

#ifndef LUDOPLUS_INVARIANTS_HPP
#define LUDOPLUS_INVARIANTS_HPP

#include <algorithm>
#include <array>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"

namespace ludo::core::debug
{
    // A second layer of checks over a whole state. Returns one line per broken invariant.
    inline auto CollectViolations(GameState const& s) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        auto fail = [&](std::string msg) { out.push_back(std::move(msg)); };

        // 1) Piece placement agrees with its path index
        for (Piece const& p : s.pieces)
        {
            if (p.finished)
            {
                if (!p.IsHero()) fail(fmt::format("support p{} marked finished", p.id));
                if (p.path_index != constants::CenterIndex || !p.position || !board::IsCenter(*p.position))
                    fail(fmt::format("finished p{} not on the center", p.id));
            }
            else if (p.position)
            {
                std::optional<Position> const expected = board::PositionFor(p.color, p.path_index);
                if (!expected || *expected != *p.position)
                    fail(fmt::format("p{} position disagrees with path index {}", p.id, p.path_index));
                if (board::IsCenter(*p.position))
                    fail(fmt::format("p{} rests on the center without finishing", p.id));
            }
            else
            {
                if (p.path_index != -1) fail(fmt::format("home p{} has path index {}", p.id, p.path_index));
                if (!p.IsHero()) fail(fmt::format("support p{} is off the board", p.id));
            }
            if (p.owner >= s.PlayerCount() || s.players[p.owner].color != p.color)
                fail(fmt::format("p{} owner/color mismatch", p.id));
        }

        // 2) Exactly one hero per seat
        for (PlayerInfo const& pl : s.players)
        {
            auto const heroes = std::ranges::count_if(s.pieces, [&](Piece const& p)
            {
                return p.owner == pl.seat && p.IsHero();
            });
            if (heroes != 1) fail(fmt::format("seat {} has {} heroes", static_cast<int>(pl.seat), heroes));
        }

        // 3) Rosters: field cap, and each subtype in exactly one place
        for (SupportRoster const& r : s.rosters)
        {
            if (r.on_field.size() > constants::MaxSupportsOnField)
                fail(fmt::format("seat {} has {} supports deployed", static_cast<int>(r.owner), r.on_field.size()));

            std::array<int, constants::SupportTypeCount> seen{};
            for (SupportType const t : r.available) ++seen[static_cast<size_t>(t)];
            for (SupportType const t : r.lost) ++seen[static_cast<size_t>(t)];
            for (PieceId const id : r.on_field)
            {
                Piece const* p = s.FindPiece(id);
                if (!p || !p->SupportKind() || p->owner != r.owner)
                {
                    fail(fmt::format("seat {} deploys unknown piece p{}", static_cast<int>(r.owner), id));
                    continue;
                }
                ++seen[static_cast<size_t>(*p->SupportKind())];
            }
            for (size_t t{}; t < seen.size(); ++t)
            {
                if (seen[t] != 1)
                    fail(fmt::format("seat {} holds subtype {} {} times", static_cast<int>(r.owner),
                                     to_string(static_cast<SupportType>(t)), seen[t]));
            }
        }
        auto const supports = std::ranges::count_if(s.pieces, [](Piece const& p) { return !p.IsHero(); });
        size_t deployed{};
        for (SupportRoster const& r : s.rosters) deployed += r.on_field.size();
        if (static_cast<size_t>(supports) != deployed)
            fail(fmt::format("{} supports on the board but {} deployed", supports, deployed));

        // 4) Cards: each hand conserves its deck, ids are unique game-wide
        std::unordered_set<CardId> ids;
        for (Hand const& h : s.hands)
        {
            if (TotalCards(h) != DeckSize)
                fail(fmt::format("seat {} accounts for {} cards", static_cast<int>(h.owner), TotalCards(h)));
            if (h.cards.size() > constants::HandSize)
                fail(fmt::format("seat {} holds {} cards", static_cast<int>(h.owner), h.cards.size()));
            for (auto const* zone : {&h.cards, &h.deck, &h.discard})
            {
                for (Card const& c : *zone)
                {
                    if (!ids.insert(c.id).second) fail(fmt::format("card #{} appears twice", c.id));
                }
            }
        }
        if (s.selected_card && !FindCard(s.hands.at(s.current), s.selected_card->id))
            fail("selected card is not in the current hand");

        // 5) Portals: summon cells only, one color per cell
        for (size_t i{}; i < s.claimed_portals.size(); ++i)
        {
            if (!s.claimed_portals[i]) continue;
            if (!board::IsSummon(*s.claimed_portals[i]))
                fail(fmt::format("color {} claims a non-summon cell", i));
            for (size_t j{i + 1}; j < s.claimed_portals.size(); ++j)
            {
                if (s.claimed_portals[j] == s.claimed_portals[i])
                    fail(fmt::format("colors {} and {} share a portal", i, j));
            }
        }

        // 6) Flow
        if (s.phase == Phase::Cleanup) fail("cleanup phase leaked out of a transition");
        if (s.winner.has_value() != (s.phase == Phase::GameOver)) fail("winner and game over disagree");
        if (s.current >= s.PlayerCount()) fail("current seat out of range");

        return out;
    }

    inline auto CheckInvariants(GameState const& s) -> void
    {
#if LUDO_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        std::vector<std::string> const broken = CollectViolations(s);
        if (!broken.empty())
            LUDO_THROW(error::Code::Assertion, fmt::format("invariants broken: {}", fmt::join(broken, "; ")));
#endif // LUDO_ENABLE_TEST_HOOKS
    }
}
#endif //LUDOPLUS_INVARIANTS_HPP
