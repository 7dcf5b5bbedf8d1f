#include <gtest/gtest.h>

#include <memory>
#include <variant>

#include "Fixtures.hpp"
#include "../core/RandomAi.hpp"
#include "../core/SimpleAi.hpp"

using namespace ludo::test;

namespace
{
    constexpr PieceId RedHero = 1;
    constexpr PieceId BlueHero = 2;
    constexpr Position RedPortal{1, 1};

    auto Decide(GameState const& s) -> PlayerAction
    {
        std::optional<PlayerAction> const a = SimpleAI::Decide(s);
        EXPECT_TRUE(a.has_value());
        return a.value_or(EndTurnAction{});
    }
}

TEST(SimpleAI, Flow_Decisions)
{
    EXPECT_EQ(Decide(MakeState(2, 42, true)), PlayerAction{StartTurnAction{}});

    GameState s = MakeState();
    EXPECT_EQ(Decide(s), (PlayerAction{SelectCardAction{s.hands[0].cards.front().id}}));

    GameState choice = MakeState();
    choice.phase = Phase::PortalChoice;
    choice.pending_portal = Position{5, 1};
    EXPECT_EQ(Decide(choice), (PlayerAction{ClaimPortalAction{}}));

    GameState pushing = MakeState();
    pushing.phase = Phase::SelectPushTarget;
    EXPECT_EQ(Decide(pushing), (PlayerAction{CancelAbilityAction{}}));

    GameState over = MakeState();
    over.phase = Phase::GameOver;
    over.winner = 0;
    EXPECT_FALSE(SimpleAI::Decide(over).has_value());
}

TEST(SimpleAI, Moves_Before_Entering)
{
    GameState s = MakeState();
    PieceId const escort = AddSupportAtIndex(s, 0, SupportType::Escort, 10);
    ForceCard(s, 2);
    EXPECT_EQ(Decide(s), (PlayerAction{MovePieceAction{escort}}));
}

TEST(SimpleAI, Enters_Through_The_Portal_First)
{
    GameState s = MakeState();
    ForceCard(s, 1);
    EXPECT_EQ(Decide(s), (PlayerAction{EnterPieceAction{RedHero, false}}));

    s.claimed_portals[static_cast<size_t>(Color::Red)] = RedPortal;
    EXPECT_EQ(Decide(s), (PlayerAction{EnterPieceAction{RedHero, true}}));
}

TEST(SimpleAI, Summons_When_Nothing_Can_Move)
{
    GameState s = MakeState();
    PlaceAtIndex(s, RedHero, 46);
    ForceCard(s, 5);
    EXPECT_EQ(Decide(s), (PlayerAction{SummonSupportAction{SupportType::Escort, false}}));

    s.claimed_portals[static_cast<size_t>(Color::Red)] = RedPortal;
    EXPECT_EQ(Decide(s), (PlayerAction{SummonSupportAction{SupportType::Escort, true}}));
}

TEST(SimpleAI, Refreshes_As_A_Last_Resort)
{
    GameState s = MakeState();
    PlaceAtIndex(s, RedHero, 46);
    AddSupportAtIndex(s, 0, SupportType::Escort, 45);
    AddSupportAtIndex(s, 0, SupportType::Blocker, 44);
    AddSupportAtIndex(s, 0, SupportType::Assassin, 43);
    ForceCard(s, 6);
    EXPECT_EQ(Decide(s), (PlayerAction{RefreshHandAction{}}));
}

TEST(SimpleAI, Decisions_Are_Always_Legal)
{
    GameState s = MakeState(3, 2024);
    for (int i = 0; i < 300 && s.phase != Phase::GameOver; ++i)
    {
        std::optional<PlayerAction> const a = SimpleAI::Decide(s);
        ASSERT_TRUE(a.has_value());
        Transition const t = RunAction(s, *a);
        ASSERT_NE(t.outcome, MoveOutcome::Invalid) << to_string(*a) << ": " << error::describe(*t.violation);
        s = t.state;
    }
    ExpectConsistent(s);
}

TEST(RandomAI, Picks_Only_Legal_Actions)
{
    RandomAI ai{7};
    auto s = std::make_shared<GameState const>(MakeState(4, 99));
    for (int i = 0; i < 500 && s->phase != Phase::GameOver; ++i)
    {
        std::optional<PlayerAction> const a = ai.Play(s);
        ASSERT_TRUE(a.has_value());
        Transition t = RunAction(*s, *a);
        ASSERT_NE(t.outcome, MoveOutcome::Invalid) << to_string(*a) << ": " << error::describe(*t.violation);
        s = std::make_shared<GameState const>(std::move(t.state));
    }
    ExpectConsistent(*s);
}

TEST(RandomAI, Does_Not_Arm_A_Pusher_With_Nothing_To_Push)
{
    GameState s = MakeState();
    AddSupportAtIndex(s, 0, SupportType::Pusher, 10);
    PlaceAt(s, BlueHero, {3, 6});
    auto const snap = std::make_shared<GameState const>(s);

    RandomAI ai{1};
    for (int i = 0; i < 50; ++i)
    {
        std::optional<PlayerAction> const a = ai.Play(snap);
        ASSERT_TRUE(a.has_value());
        EXPECT_FALSE(std::holds_alternative<ActivatePusherAction>(*a));
    }
}
