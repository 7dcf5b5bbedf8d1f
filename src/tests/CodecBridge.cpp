#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <variant>

#include "Fixtures.hpp"
#include "../bridge/Codec.hpp"

using namespace ludo::test;
using ludo::core::bridge::BuildAction;
using ludo::core::bridge::BuildSnapshot;
using ludo::core::bridge::BuildViolation;
using ludo::core::bridge::DecodePlayerAction;

namespace gb = ::ludo::gen::bridge;

namespace
{
    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    inline auto MakeSummonFB(gb::SupportType type, uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const act = gb::CreateAction_SummonSupport(fbb, type, false);
        auto const msg = gb::CreateActionMsg(fbb, msg_id, 0, gb::Action::Action_SummonSupport, act.Union());
        auto const env = gb::CreateEnvelope(fbb, gb::Message::ActionMsg, msg.Union());
        fbb.Finish(env);
        return fbb.Release();
    }
}

TEST(Codec, Actions_Survive_The_Wire)
{
    std::array<PlayerAction, 5> const actions{
        SelectCardAction{17},
        StealPortalAction{Position{5, 1}},
        SummonSupportAction{SupportType::Pusher, true},
        ResetGameAction{3, Color::Yellow, true},
        CancelAbilityAction{}};

    uint64_t id{100};
    for (PlayerAction const& a : actions)
    {
        flatbuffers::DetachedBuffer const buf = BuildAction(2, a, id);
        auto const decoded = DecodePlayerAction(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
        EXPECT_EQ(decoded->msg_id, id);
        EXPECT_EQ(decoded->actor, 2);
        EXPECT_EQ(decoded->action, a) << to_string(a);
        ++id;
    }
}

TEST(Codec, Snapshot_Carries_The_Table)
{
    GameState s = MakeState(3, 11);
    PlaceAtIndex(s, 1, 26);
    s.claimed_portals[static_cast<size_t>(Color::Red)] = Position{1, 1};
    Card const card = ForceCard(s, 4);
    s = RunAction(s, EndTurnAction{}).state;

    flatbuffers::DetachedBuffer const buf = BuildSnapshot(s, 7);
    flatbuffers::Verifier verifier(buf.data(), buf.size());
    ASSERT_TRUE(gb::VerifyEnvelopeBuffer(verifier));

    auto const* env = gb::GetEnvelope(buf.data());
    ASSERT_EQ(env->message_type(), gb::Message::SnapshotMsg);
    auto const* snap = env->message_as_SnapshotMsg();
    EXPECT_EQ(snap->msg_id(), 7u);

    auto const* view = snap->view();
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->n_players(), 3);
    EXPECT_EQ(view->current(), 1);
    EXPECT_EQ(view->phase(), gb::Phase::SelectCard);
    EXPECT_EQ(view->winner(), -1);
    EXPECT_EQ(view->selected_card(), nullptr);
    EXPECT_EQ(view->pending_portal(), nullptr);

    ASSERT_EQ(view->players()->size(), 3u);
    EXPECT_EQ(view->players()->Get(1)->name()->str(), "CPU 1");
    EXPECT_EQ(view->players()->Get(2)->color(), gb::Color::Green);

    ASSERT_EQ(view->pieces()->size(), 3u);
    auto const* hero = view->pieces()->Get(0);
    EXPECT_EQ(hero->kind(), gb::PieceType::Hero);
    ASSERT_NE(hero->cell(), nullptr);
    EXPECT_EQ(hero->cell()->row(), 1);
    EXPECT_EQ(hero->cell()->col(), 1);
    EXPECT_EQ(hero->path_index(), 26);
    EXPECT_EQ(view->pieces()->Get(1)->cell(), nullptr);
    EXPECT_EQ(view->pieces()->Get(1)->path_index(), -1);

    ASSERT_EQ(view->hands()->size(), 3u);
    auto const* red_hand = view->hands()->Get(0);
    EXPECT_EQ(red_hand->cards()->size(), constants::HandSize);
    EXPECT_EQ(red_hand->deck_count() + red_hand->discard_count() + red_hand->cards()->size(), DeckSize);
    bool kept{false};
    for (auto const* c : *red_hand->cards()) kept |= c->id() == card.id;
    EXPECT_TRUE(kept);

    EXPECT_EQ(view->rosters()->Get(0)->available()->size(), constants::SupportTypeCount);
    ASSERT_EQ(view->portals()->size(), 1u);
    EXPECT_EQ(view->portals()->Get(0)->color(), gb::Color::Red);

    ASSERT_EQ(view->log()->size(), 1u);
    EXPECT_EQ(view->log()->Get(0)->action(), gb::LogAction::Skipped);
    EXPECT_EQ(view->log()->Get(0)->piece(), gb::PieceType::None);
}

TEST(Codec, Violation_Message)
{
    error::RuleViolation v{.code = error::RuleViolationCode::Move_Overshoot};
    v.with_piece(3).with_steps(7);

    flatbuffers::DetachedBuffer const buf = BuildViolation(v, 9);
    auto const* env = gb::GetEnvelope(buf.data());
    ASSERT_EQ(env->message_type(), gb::Message::Violation);
    auto const* msg = env->message_as_Violation();
    EXPECT_EQ(msg->msg_id(), 9u);
    EXPECT_EQ(msg->code(), static_cast<uint16_t>(error::RuleViolationCode::Move_Overshoot));
    EXPECT_EQ(msg->text()->str(), error::describe(v));
}

TEST(Codec, Decode_Rejects_Bad_Input)
{
    std::array<std::byte, 6> const garbage{std::byte{1}, std::byte{2}, std::byte{3},
                                           std::byte{4}, std::byte{5}, std::byte{6}};
    EXPECT_FALSE(DecodePlayerAction(garbage).has_value());
    EXPECT_FALSE(DecodePlayerAction({}).has_value());

    flatbuffers::DetachedBuffer const snap = BuildSnapshot(MakeState(), 1);
    auto const not_action = DecodePlayerAction(AsBytes(snap));
    ASSERT_FALSE(not_action.has_value());
    EXPECT_EQ(not_action.error().message, "not an ActionMsg");

    flatbuffers::DetachedBuffer const bad_enum = MakeSummonFB(static_cast<gb::SupportType>(9), 2);
    EXPECT_FALSE(DecodePlayerAction(AsBytes(bad_enum)).has_value());
    EXPECT_TRUE(DecodePlayerAction(AsBytes(MakeSummonFB(gb::SupportType::Blocker, 3))).has_value());

    flatbuffers::FlatBufferBuilder fbb;
    auto const steal = gb::CreateAction_StealPortal(fbb, nullptr);
    auto const msg = gb::CreateActionMsg(fbb, 4, 0, gb::Action::Action_StealPortal, steal.Union());
    fbb.Finish(gb::CreateEnvelope(fbb, gb::Message::ActionMsg, msg.Union()));
    flatbuffers::DetachedBuffer const no_cell = fbb.Release();
    EXPECT_FALSE(DecodePlayerAction(AsBytes(no_cell)).has_value());
}
