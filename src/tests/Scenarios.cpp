#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace ludo::test;
using RVC = ludo::core::error::RuleViolationCode;

namespace
{
    constexpr PieceId RedHero = 1;
    constexpr PieceId BlueHero = 2;
    constexpr Position RedPortal{1, 1};

    // Picks the first card through the public action, after fixing its value.
    auto SelectValue(GameState s, uint8_t value) -> GameState
    {
        Card& c = s.hands.at(s.current).cards.front();
        c.value = value;
        Transition const t = RunAction(s, SelectCardAction{c.id});
        EXPECT_EQ(t.outcome, MoveOutcome::Applied);
        return t.state;
    }
}

TEST(Race, Exact_Card_Reaches_The_Center)
{
    GameState s = MakeState();
    PlaceAtIndex(s, RedHero, 45);
    s = SelectValue(s, 3);

    Transition const t = RunAction(s, MovePieceAction{RedHero});
    ASSERT_EQ(t.outcome, MoveOutcome::GameEnded);
    EXPECT_EQ(t.state.winner, 0);
    ExpectRejected(t.state, EndTurnAction{}, RVC::GameAlreadyOver);
}

TEST(Race, Too_High_A_Card_Is_Refused)
{
    GameState s = MakeState();
    PlaceAtIndex(s, RedHero, 46);
    s = SelectValue(s, 5);

    ExpectRejected(s, MovePieceAction{RedHero}, RVC::Move_Overshoot);
    EXPECT_FALSE(query::GetValidMoves(s, RedHero).can_move);
}

TEST(Pusher, Hero_Pushed_Into_The_Center_Wins_For_Its_Owner)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupport(s, 0, SupportType::Pusher, RedPortal);
    PlaceAt(s, BlueHero, {2, 2});

    Transition const armed = RunAction(s, ActivatePusherAction{pusher});
    ASSERT_EQ(armed.outcome, MoveOutcome::Applied);
    EXPECT_EQ(armed.state.phase, Phase::SelectPushTarget);
    EXPECT_EQ(armed.state.ability_piece, pusher);

    Transition const t = RunAction(armed.state, ExecutePushAction{BlueHero});
    ASSERT_EQ(t.outcome, MoveOutcome::GameEnded);
    EXPECT_EQ(t.state.winner, 1);
    Piece const& blue = *t.state.FindPiece(BlueHero);
    EXPECT_TRUE(blue.finished);
    EXPECT_EQ(blue.position, board::Center);
    EXPECT_EQ(CountLog(t.state, LogAction::AbilityUsed), 1);
    EXPECT_EQ(LastLog(t.state).action, LogAction::Finished);
    EXPECT_EQ(LastLog(t.state).actor, 1);
    ExpectConsistent(t.state);
}

TEST(Pusher, Support_Pushed_Into_The_Center_Is_Removed)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupport(s, 0, SupportType::Pusher, RedPortal);
    PieceId const escort = AddSupport(s, 1, SupportType::Escort, {2, 2});

    GameState const armed = RunAction(s, ActivatePusherAction{pusher}).state;
    Transition const t = RunAction(armed, ExecutePushAction{escort});
    ASSERT_EQ(t.outcome, MoveOutcome::Applied);
    EXPECT_EQ(t.state.FindPiece(escort), nullptr);
    EXPECT_TRUE(IsAvailable(t.state.rosters[1], SupportType::Escort));
    EXPECT_FALSE(t.state.winner.has_value());
    EXPECT_EQ(t.state.phase, Phase::SelectCard);
    EXPECT_EQ(t.state.current, 0);
    ExpectConsistent(t.state);
}

TEST(Pusher, Push_Moves_The_Target_One_Cell_Away)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupportAtIndex(s, 0, SupportType::Pusher, 3); // (0,0)
    PlaceAt(s, BlueHero, RedPortal);

    EXPECT_EQ(query::GetPushTargets(s, pusher), std::vector<PieceId>{BlueHero});

    GameState const armed = RunAction(s, ActivatePusherAction{pusher}).state;
    Transition const t = RunAction(armed, ExecutePushAction{BlueHero});
    ASSERT_EQ(t.outcome, MoveOutcome::Applied);

    Piece const& blue = *t.state.FindPiece(BlueHero);
    EXPECT_EQ(blue.position, (Position{2, 2}));
    EXPECT_EQ(blue.path_index, 43);
    EXPECT_TRUE(t.state.pusher_used);
    EXPECT_FALSE(t.state.ability_piece.has_value());
    EXPECT_EQ(t.state.FindPiece(pusher)->position, (Position{0, 0}));
    ExpectConsistent(t.state);

    // one push per turn
    ExpectRejected(t.state, ActivatePusherAction{pusher}, RVC::Pusher_AlreadyUsed);

    // the turn goes on with a card
    GameState const selected = SelectValue(t.state, 1);
    EXPECT_EQ(selected.phase, Phase::SelectAction);
    EXPECT_FALSE(RunAction(selected, EndTurnAction{}).state.pusher_used);
}

TEST(Pusher, Pushed_Piece_Takes_Whatever_Stands_On_The_Destination)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupportAtIndex(s, 0, SupportType::Pusher, 3);
    PlaceAt(s, BlueHero, RedPortal);
    PlaceAt(s, RedHero, {2, 2});

    GameState const armed = RunAction(s, ActivatePusherAction{pusher}).state;
    Transition const t = RunAction(armed, ExecutePushAction{BlueHero});
    ASSERT_EQ(t.outcome, MoveOutcome::Applied);
    EXPECT_FALSE(t.state.FindPiece(RedHero)->position.has_value());
    EXPECT_EQ(t.state.FindPiece(BlueHero)->position, (Position{2, 2}));
    EXPECT_EQ(CountLog(t.state, LogAction::Captured), 1);
    EXPECT_EQ(CountLog(t.state, LogAction::HeroReset), 1);
    ExpectConsistent(t.state);
}

TEST(Pusher, Cancel_Returns_To_The_Previous_Phase)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupportAtIndex(s, 0, SupportType::Pusher, 3);
    PlaceAt(s, BlueHero, RedPortal);

    GameState const no_card = RunAction(s, ActivatePusherAction{pusher}).state;
    Transition const back = RunAction(no_card, CancelAbilityAction{});
    ASSERT_EQ(back.outcome, MoveOutcome::Applied);
    EXPECT_EQ(back.state.phase, Phase::SelectCard);
    EXPECT_FALSE(back.state.ability_piece.has_value());
    EXPECT_FALSE(back.state.pusher_used);

    Card const card = ForceCard(s, 4);
    GameState const with_card = RunAction(s, ActivatePusherAction{pusher}).state;
    EXPECT_EQ(with_card.selected_card, card);
    GameState const restored = RunAction(with_card, CancelAbilityAction{}).state;
    EXPECT_EQ(restored.phase, Phase::SelectAction);
    EXPECT_EQ(restored.selected_card, card);

    // a push also lands back on the card
    GameState const pushed = RunAction(with_card, ExecutePushAction{BlueHero}).state;
    EXPECT_EQ(pushed.phase, Phase::SelectAction);
    EXPECT_EQ(pushed.selected_card, card);
}

TEST(Pusher, Rejections)
{
    GameState s = MakeState();
    PieceId const pusher = AddSupport(s, 0, SupportType::Pusher, RedPortal);
    PieceId const foreign = AddSupport(s, 1, SupportType::Pusher, {5, 5});
    PlaceAt(s, RedHero, {0, 0});   // pushing it would leave the board
    PlaceAt(s, BlueHero, {4, 4});  // not adjacent

    ExpectRejected(s, ActivatePusherAction{RedHero}, RVC::Pusher_NotOwnPusher);
    ExpectRejected(s, ActivatePusherAction{foreign}, RVC::NotOwnPiece);
    ExpectRejected(s, ExecutePushAction{BlueHero}, RVC::WrongPhase_PushTargetRequired);
    ExpectRejected(s, CancelAbilityAction{}, RVC::WrongPhase_PushTargetRequired);

    EXPECT_TRUE(query::GetPushTargets(s, pusher).empty());

    GameState const armed = RunAction(s, ActivatePusherAction{pusher}).state;
    ExpectRejected(armed, ExecutePushAction{RedHero}, RVC::Push_InvalidTarget);
    ExpectRejected(armed, ExecutePushAction{BlueHero}, RVC::Push_InvalidTarget);
    ExpectRejected(armed, EndTurnAction{}, RVC::WrongPhase_CardSelectionRequired);
    ExpectRejected(armed, MovePieceAction{RedHero}, RVC::WrongPhase_SelectActionRequired);
}

TEST(Portal, First_Summon_Cell_Is_Claimed_Automatically)
{
    GameState s = MakeState();
    PlaceAtIndex(s, RedHero, 23);
    ForceCard(s, 3);

    Transition const t = RunAction(s, MovePieceAction{RedHero});
    ASSERT_EQ(t.outcome, MoveOutcome::TurnEnded);
    EXPECT_EQ(t.state.FindPiece(RedHero)->position, RedPortal);
    EXPECT_EQ(t.state.PortalOf(Color::Red), RedPortal);
    EXPECT_EQ(LastLog(t.state).action, LogAction::Claimed);
    ExpectConsistent(t.state);
}

TEST(Portal, Second_Summon_Cell_Offers_A_Choice)
{
    GameState s = MakeState();
    s.claimed_portals[static_cast<size_t>(Color::Red)] = RedPortal;
    PlaceAtIndex(s, RedHero, 27);
    ForceCard(s, 3);

    Transition const landed = RunAction(s, MovePieceAction{RedHero});
    ASSERT_EQ(landed.outcome, MoveOutcome::Applied);
    EXPECT_EQ(landed.state.phase, Phase::PortalChoice);
    EXPECT_EQ(landed.state.pending_portal, (Position{5, 1}));
    EXPECT_EQ(landed.state.current, 0);
    ExpectConsistent(landed.state);

    ExpectRejected(landed.state, EndTurnAction{}, RVC::WrongPhase_CardSelectionRequired);
    ExpectRejected(s, ClaimPortalAction{}, RVC::WrongPhase_PortalChoiceRequired);

    Transition const skipped = RunAction(landed.state, SkipPortalAction{});
    ASSERT_EQ(skipped.outcome, MoveOutcome::TurnEnded);
    EXPECT_EQ(skipped.state.PortalOf(Color::Red), RedPortal);
    EXPECT_FALSE(skipped.state.pending_portal.has_value());

    Transition const claimed = RunAction(landed.state, ClaimPortalAction{});
    ASSERT_EQ(claimed.outcome, MoveOutcome::TurnEnded);
    EXPECT_EQ(claimed.state.PortalOf(Color::Red), (Position{5, 1}));
    EXPECT_FALSE(claimed.state.PortalOwner(RedPortal).has_value());
    EXPECT_EQ(LastLog(claimed.state).action, LogAction::Claimed);
    ExpectConsistent(claimed.state);
}

TEST(Portal, Claimed_Portal_Of_Another_Color_Is_Left_Alone)
{
    GameState s = MakeState();
    s.claimed_portals[static_cast<size_t>(Color::Blue)] = RedPortal;
    PlaceAtIndex(s, RedHero, 23);
    ForceCard(s, 3);

    Transition const t = RunAction(s, MovePieceAction{RedHero});
    ASSERT_EQ(t.outcome, MoveOutcome::TurnEnded);
    EXPECT_EQ(t.state.PortalOwner(RedPortal), Color::Blue);
    EXPECT_FALSE(t.state.PortalOf(Color::Red).has_value());
}
