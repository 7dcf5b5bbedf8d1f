//
// Created by Malik T on 14/08/2025.
//

#ifndef LUDOPLUS_ACTIONS_HPP
#define LUDOPLUS_ACTIONS_HPP

#include "Types.hpp"

namespace ludo::core
{
    struct SelectCardAction
    {
        CardId card_id{};
        auto operator==(SelectCardAction const&) const -> bool = default;
    };
    struct UnselectCardAction
    {
        auto operator==(UnselectCardAction const&) const -> bool = default;
    };
    // use_portal = enter on the owned portal instead of the default entry
    struct EnterPieceAction
    {
        PieceId piece_id{};
        bool use_portal{false};
        auto operator==(EnterPieceAction const&) const -> bool = default;
    };
    struct MovePieceAction
    {
        PieceId piece_id{};
        auto operator==(MovePieceAction const&) const -> bool = default;
    };
    struct ClaimPortalAction
    {
        auto operator==(ClaimPortalAction const&) const -> bool = default;
    };
    struct SkipPortalAction
    {
        auto operator==(SkipPortalAction const&) const -> bool = default;
    };
    struct StealPortalAction
    {
        Position position{};
        auto operator==(StealPortalAction const&) const -> bool = default;
    };
    struct EndTurnAction
    {
        auto operator==(EndTurnAction const&) const -> bool = default;
    };
    struct StartTurnAction
    {
        auto operator==(StartTurnAction const&) const -> bool = default;
    };
    struct RefreshHandAction
    {
        auto operator==(RefreshHandAction const&) const -> bool = default;
    };
    struct ResetGameAction
    {
        uint32_t player_count{4};
        Color human_color{Color::Red};
        bool hotseat{false};
        auto operator==(ResetGameAction const&) const -> bool = default;
    };
    struct SummonSupportAction
    {
        SupportType type{};
        bool use_portal{false};
        auto operator==(SummonSupportAction const&) const -> bool = default;
    };
    struct ActivatePusherAction
    {
        PieceId piece_id{};
        auto operator==(ActivatePusherAction const&) const -> bool = default;
    };
    struct ExecutePushAction
    {
        PieceId target_id{};
        auto operator==(ExecutePushAction const&) const -> bool = default;
    };
    struct CancelAbilityAction
    {
        auto operator==(CancelAbilityAction const&) const -> bool = default;
    };

    using PlayerAction = std::variant<
      SelectCardAction, UnselectCardAction, EnterPieceAction, MovePieceAction,
      ClaimPortalAction, SkipPortalAction, StealPortalAction, EndTurnAction,
      StartTurnAction, RefreshHandAction, ResetGameAction, SummonSupportAction,
      ActivatePusherAction, ExecutePushAction, CancelAbilityAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        TurnEnded,
        GameEnded,
        AwaitingInput // no policy for the current seat
    };

    enum class Phase : uint8_t
    {
        SelectCard,
        SelectAction,
        PortalChoice,
        SelectPushTarget,
        // Transient: set by Apply when the turn is over, consumed by Advance.
        Cleanup,
        GameOver
    };
} // namespace ludo::core

#endif //LUDOPLUS_ACTIONS_HPP
