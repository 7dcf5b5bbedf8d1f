//
// Created by Malik T on 02/10/2025.
//

#ifndef LUDOPLUS_NAMES_HPP
#define LUDOPLUS_NAMES_HPP

#include <string_view>

#include "Types.hpp"
#include "Actions.hpp"

namespace ludo::core
{
    inline auto to_string(Color c) -> std::string_view
    {
        switch (c)
        {
        case Color::Red: return "Red";
        case Color::Blue: return "Blue";
        case Color::Green: return "Green";
        case Color::Yellow: return "Yellow";
        }
        return "?";
    }

    inline auto to_string(SupportType t) -> std::string_view
    {
        switch (t)
        {
        case SupportType::Escort: return "escort";
        case SupportType::Blocker: return "blocker";
        case SupportType::Assassin: return "assassin";
        case SupportType::Pusher: return "pusher";
        }
        return "?";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::SelectCard: return "select_card";
        case Phase::SelectAction: return "select_action";
        case Phase::PortalChoice: return "portal_choice";
        case Phase::SelectPushTarget: return "select_push_target";
        case Phase::Cleanup: return "cleanup";
        case Phase::GameOver: return "game_over";
        }
        return "?";
    }

    inline auto to_string(PieceKind const& k) -> std::string_view
    {
        if (auto const* s = std::get_if<Support>(&k)) return to_string(s->type);
        return "hero";
    }

    inline auto to_string(PlayerAction const& a) -> std::string_view
    {
        constexpr std::array<std::string_view, std::variant_size_v<PlayerAction>> names{
            "SELECT_CARD", "UNSELECT_CARD", "ENTER_PIECE", "MOVE_PIECE",
            "CLAIM_PORTAL", "SKIP_PORTAL", "STEAL_PORTAL", "END_TURN",
            "START_TURN", "REFRESH_HAND", "RESET_GAME", "SUMMON_SUPPORT",
            "ACTIVATE_PUSHER", "EXECUTE_PUSH", "CANCEL_ABILITY"};
        return names[a.index()];
    }
}

#endif //LUDOPLUS_NAMES_HPP
