//
// Created by Malik T on 29/09/2025.
//

#include "Board.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <utility>

namespace ludo::core::board
{
    namespace
    {
        constexpr size_t OuterLength = 24;
        constexpr size_t Ring1Length = 16;
        constexpr size_t Ring2Length = 8;
        static_assert(OuterLength + Ring1Length + Ring2Length + 1 == constants::PathLength);

        // Counter-clockwise from red's entry (0,3).
        constexpr std::array<Position, OuterLength> OuterRing{{
            {0, 3}, {0, 2}, {0, 1}, {0, 0},
            {1, 0}, {2, 0}, {3, 0},
            {4, 0}, {5, 0}, {6, 0},
            {6, 1}, {6, 2}, {6, 3},
            {6, 4}, {6, 5}, {6, 6},
            {5, 6}, {4, 6}, {3, 6},
            {2, 6}, {1, 6}, {0, 6},
            {0, 5}, {0, 4}
        }};

        constexpr std::array<Position, Ring1Length> Ring1{{
            {1, 3}, {1, 2}, {1, 1},
            {2, 1}, {3, 1},
            {4, 1}, {5, 1},
            {5, 2}, {5, 3},
            {5, 4}, {5, 5},
            {4, 5}, {3, 5},
            {2, 5}, {1, 5},
            {1, 4}
        }};

        constexpr std::array<Position, Ring2Length> Ring2{{
            {2, 3}, {2, 2},
            {3, 2}, {4, 2},
            {4, 3}, {4, 4},
            {3, 4}, {2, 4}
        }};

        constexpr std::array<Position, constants::ColorCount> Entries{{
            {0, 3}, // red
            {3, 6}, // blue
            {6, 3}, // green
            {3, 0}  // yellow
        }};

        // Ring 1 corners, one per quadrant.
        constexpr std::array<Position, 4> Summons{{
            {1, 1}, {1, 5}, {5, 1}, {5, 5}
        }};

        struct RingOffsets
        {
            size_t outer;
            size_t ring1;
            size_t ring2;
        };

        constexpr auto OffsetsFor(Color c) noexcept -> RingOffsets
        {
            switch (c)
            {
            case Color::Red: return {0, 0, 0};
            case Color::Yellow: return {6, 4, 2};
            case Color::Green: return {12, 8, 4};
            case Color::Blue: return {18, 12, 6};
            }
            return {0, 0, 0};
        }

        auto BuildPath(Color c) -> PathT
        {
            RingOffsets const off = OffsetsFor(c);
            PathT path{};
            size_t k{};
            for (size_t i{}; i < OuterLength; ++i) path[k++] = OuterRing[(off.outer + i) % OuterLength];
            for (size_t i{}; i < Ring1Length; ++i) path[k++] = Ring1[(off.ring1 + i) % Ring1Length];
            for (size_t i{}; i < Ring2Length; ++i) path[k++] = Ring2[(off.ring2 + i) % Ring2Length];
            path[k] = Center;
            return path;
        }

        auto BuildAllCells() -> std::vector<Position>
        {
            std::vector<Position> cells;
            cells.reserve(constants::PathLength);
            cells.insert(cells.end(), OuterRing.begin(), OuterRing.end());
            cells.insert(cells.end(), Ring1.begin(), Ring1.end());
            cells.insert(cells.end(), Ring2.begin(), Ring2.end());
            cells.push_back(Center);
            return cells;
        }

        auto Contains(std::span<Position const> cells, Position pos) noexcept -> bool
        {
            return std::ranges::find(cells, pos) != cells.end();
        }

        auto Sign(int v) noexcept -> int { return (v > 0) - (v < 0); }
    }

    auto PathFor(Color c) -> PathT const&
    {
        static std::array<PathT, constants::ColorCount> const paths{
            BuildPath(Color::Red), BuildPath(Color::Blue), BuildPath(Color::Green), BuildPath(Color::Yellow)};
        return paths[static_cast<size_t>(c)];
    }

    auto AllPathCells() -> std::span<Position const>
    {
        static std::vector<Position> const cells = BuildAllCells();
        return cells;
    }

    auto EntryPosition(Color c) noexcept -> Position
    {
        return Entries[static_cast<size_t>(c)];
    }

    auto SummonPositions() noexcept -> std::span<Position const>
    {
        return Summons;
    }

    auto PositionFor(Color c, int idx) -> std::optional<Position>
    {
        if (idx < 0 || idx >= constants::PathLength) return std::nullopt;
        return PathFor(c)[static_cast<size_t>(idx)];
    }

    auto IndexOnPath(Color c, Position pos) -> int
    {
        PathT const& path = PathFor(c);
        auto const it = std::ranges::find(path, pos);
        return it == path.end() ? -1 : static_cast<int>(std::distance(path.begin(), it));
    }

    auto IsOnPath(Position pos) -> bool
    {
        return Contains(AllPathCells(), pos);
    }

    auto IsSafe(Position pos) noexcept -> bool
    {
        return Contains(Entries, pos);
    }

    auto IsSummon(Position pos) noexcept -> bool
    {
        return Contains(Summons, pos);
    }

    auto IsCenter(Position pos) noexcept -> bool
    {
        return pos == Center;
    }

    auto CellTypeAt(Position pos) -> CellType
    {
        if (IsCenter(pos)) return CellType::Center;
        if (!IsOnPath(pos)) return CellType::Empty;
        // every safe cell is an entry cell, so Entry wins and Safe is never returned;
        // the value is kept so cell classification lists every marker
        if (EntryColor(pos)) return CellType::Entry;
        if (IsSafe(pos)) return CellType::Safe;
        if (IsSummon(pos)) return CellType::Summon;
        return CellType::Path;
    }

    auto EntryColor(Position pos) noexcept -> std::optional<Color>
    {
        for (size_t i{}; i < Entries.size(); ++i)
        {
            if (Entries[i] == pos) return static_cast<Color>(i);
        }
        return std::nullopt;
    }

    auto AreAdjacent(Position a, Position b) noexcept -> bool
    {
        int const dr = std::abs(a.row - b.row);
        int const dc = std::abs(a.col - b.col);
        return dr <= 1 && dc <= 1 && (dr > 0 || dc > 0);
    }

    auto AdjacentPositions(Position pos) -> std::vector<Position>
    {
        std::vector<Position> out;
        for (int dr = -1; dr <= 1; ++dr)
        {
            for (int dc = -1; dc <= 1; ++dc)
            {
                if (dr == 0 && dc == 0) continue;
                Position const p{static_cast<int8_t>(pos.row + dr), static_cast<int8_t>(pos.col + dc)};
                if (IsOnPath(p)) out.push_back(p);
            }
        }
        return out;
    }

    auto PushDestination(Position pusher, Position target) -> std::optional<Position>
    {
        Position const dest{
            static_cast<int8_t>(target.row + Sign(target.row - pusher.row)),
            static_cast<int8_t>(target.col + Sign(target.col - pusher.col))};
        if (!IsOnPath(dest)) return std::nullopt; // off the board
        return dest;
    }
}
