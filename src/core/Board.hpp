//
// Created by Malik T on 29/09/2025.
//

#ifndef LUDOPLUS_BOARD_HPP
#define LUDOPLUS_BOARD_HPP

#include <array>
#include <optional>
#include <span>
#include <vector>

#include "Types.hpp"

namespace ludo::core::board
{
    enum class CellType : uint8_t
    {
        Empty,
        Path,
        Safe,
        Entry,
        Summon,
        Center
    };

    inline constexpr Position Center{3, 3};

    using PathT = std::array<Position, constants::PathLength>;

    // Built once on first use; identical length for every color, last cell is Center.
    auto PathFor(Color c) -> PathT const&;
    auto AllPathCells() -> std::span<Position const>;

    auto EntryPosition(Color c) noexcept -> Position;
    auto SummonPositions() noexcept -> std::span<Position const>;

    // nullopt when idx is outside [0, PathLength)
    auto PositionFor(Color c, int idx) -> std::optional<Position>;
    // -1 when pos is not on the color's path
    auto IndexOnPath(Color c, Position pos) -> int;

    auto IsOnPath(Position pos) -> bool;
    auto IsSafe(Position pos) noexcept -> bool;
    auto IsSummon(Position pos) noexcept -> bool;
    auto IsCenter(Position pos) noexcept -> bool;
    auto CellTypeAt(Position pos) -> CellType;
    auto EntryColor(Position pos) noexcept -> std::optional<Color>;

    // Chebyshev distance 1, self excluded.
    auto AreAdjacent(Position a, Position b) noexcept -> bool;
    auto AdjacentPositions(Position pos) -> std::vector<Position>;
    auto PushDestination(Position pusher, Position target) -> std::optional<Position>;
}

#endif //LUDOPLUS_BOARD_HPP
