#include <gtest/gtest.h>

#include <set>
#include <utility>

#include "../core/Board.hpp"

using namespace ludo::core;
using namespace ludo::core::board;

namespace
{
    constexpr std::array<Color, 4> AllColors{Color::Red, Color::Blue, Color::Green, Color::Yellow};

    auto Key(Position p) -> std::pair<int, int> { return {p.row, p.col}; }
}

TEST(Board, Paths_Start_At_Entry_And_End_At_Center)
{
    for (Color const c : AllColors)
    {
        PathT const& path = PathFor(c);
        EXPECT_EQ(path.front(), EntryPosition(c));
        EXPECT_EQ(path.back(), Center);
        EXPECT_EQ(PositionFor(c, constants::CenterIndex), Center);
    }
}

TEST(Board, Every_Path_Visits_All_49_Cells_Once)
{
    for (Color const c : AllColors)
    {
        std::set<std::pair<int, int>> seen;
        for (Position const p : PathFor(c)) seen.insert(Key(p));
        EXPECT_EQ(seen.size(), static_cast<size_t>(constants::PathLength));
    }
    EXPECT_EQ(AllPathCells().size(), static_cast<size_t>(constants::PathLength));
}

TEST(Board, Outer_Ring_Then_Inner_Rings)
{
    // red: 24 outer cells, ring one starts under its entry
    EXPECT_EQ(PositionFor(Color::Red, 23), (Position{0, 4}));
    EXPECT_EQ(PositionFor(Color::Red, 24), (Position{1, 3}));
    EXPECT_EQ(PositionFor(Color::Red, 26), (Position{1, 1}));
    EXPECT_EQ(PositionFor(Color::Red, 40), (Position{2, 3}));
    EXPECT_EQ(PositionFor(Color::Red, 47), (Position{2, 4}));

    // blue enters on the right edge and turns inward beside its entry
    EXPECT_EQ(PositionFor(Color::Blue, 1), (Position{2, 6}));
    EXPECT_EQ(PositionFor(Color::Blue, 24), (Position{3, 5}));
    EXPECT_EQ(PositionFor(Color::Blue, 26), (Position{1, 5}));
}

TEST(Board, Index_Out_Of_Range_Has_No_Position)
{
    EXPECT_FALSE(PositionFor(Color::Red, -1).has_value());
    EXPECT_FALSE(PositionFor(Color::Red, constants::PathLength).has_value());
}

TEST(Board, IndexOnPath_Inverts_PositionFor)
{
    for (Color const c : AllColors)
    {
        for (int i : {0, 7, 23, 24, 39, 40, 48})
        {
            EXPECT_EQ(IndexOnPath(c, *PositionFor(c, i)), i);
        }
    }
    EXPECT_EQ(IndexOnPath(Color::Green, Position{7, 7}), -1);
}

TEST(Board, Cell_Classification)
{
    EXPECT_EQ(CellTypeAt({0, 3}), CellType::Entry);
    EXPECT_EQ(CellTypeAt({3, 6}), CellType::Entry);
    EXPECT_EQ(CellTypeAt({3, 3}), CellType::Center);
    EXPECT_EQ(CellTypeAt({1, 1}), CellType::Summon);
    EXPECT_EQ(CellTypeAt({5, 5}), CellType::Summon);
    EXPECT_EQ(CellTypeAt({0, 0}), CellType::Path);
    EXPECT_EQ(CellTypeAt({-1, 0}), CellType::Empty);

    for (Color const c : AllColors)
    {
        EXPECT_TRUE(IsSafe(EntryPosition(c)));
        EXPECT_EQ(EntryColor(EntryPosition(c)), c);
        // safe cells classify as their entry
        EXPECT_EQ(CellTypeAt(EntryPosition(c)), CellType::Entry);
    }
    EXPECT_FALSE(IsSafe({0, 0}));
    EXPECT_FALSE(IsSafe(Center));
    EXPECT_EQ(SummonPositions().size(), 4u);
}

TEST(Board, Adjacency_Is_Chebyshev_One)
{
    EXPECT_TRUE(AreAdjacent({0, 0}, {1, 1}));
    EXPECT_TRUE(AreAdjacent({3, 3}, {2, 3}));
    EXPECT_FALSE(AreAdjacent({0, 0}, {0, 0}));
    EXPECT_FALSE(AreAdjacent({0, 0}, {2, 2}));

    EXPECT_EQ(AdjacentPositions({0, 0}).size(), 3u);
    EXPECT_EQ(AdjacentPositions({0, 3}).size(), 5u);
    EXPECT_EQ(AdjacentPositions(Center).size(), 8u);
}

TEST(Board, Push_Continues_Along_The_Pusher_Vector)
{
    EXPECT_EQ(PushDestination({0, 0}, {1, 1}), (Position{2, 2}));
    EXPECT_EQ(PushDestination({1, 3}, {1, 2}), (Position{1, 1}));
    EXPECT_EQ(PushDestination({1, 1}, {2, 2}), Center);

    // off the grid
    EXPECT_FALSE(PushDestination({1, 0}, {0, 0}).has_value());
    EXPECT_FALSE(PushDestination({5, 5}, {6, 6}).has_value());
}
