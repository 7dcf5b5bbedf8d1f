//
// Created by Malik T on 14/08/2025.
//

#ifndef LUDOPLUS_EXCEPTION_HPP
#define LUDOPLUS_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"
#include "Actions.hpp"
#include "Names.hpp"

namespace ludo::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse (not user invalid move)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define LUDO_THROW(code_enum, msg) ::ludo::core::error::fail((code_enum), (msg))
#define LUDO_ASSERT(cond, msg) do { if(!(cond)) ::ludo::core::error::fail(::ludo::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        GameAlreadyOver,
        TurnNotStarted,
        WrongPhase_CardSelectionRequired,
        WrongPhase_SelectActionRequired,
        WrongPhase_PortalChoiceRequired,
        WrongPhase_PushTargetRequired,
        NoCardSelected,
        UnknownPiece,
        NotOwnPiece,

        // Select
        Select_CardNotInHand,

        // Enter
        Enter_NotHero,
        Enter_NotAtHome,
        Enter_StartAtCapacity,
        Enter_StartHeldByOpponent,
        Enter_NoPortal,
        Enter_PortalOccupied,

        // Move
        Move_NotOnBoard,
        Move_PieceFinished,
        Move_Overshoot,
        Move_CellAtCapacity,
        Move_OwnPieceOnTarget,

        // Portals
        Portal_NothingPending,
        Steal_NotAClaimedPortal,
        Steal_OwnPortal,
        Steal_NoOpposingPieceOnPortal,

        // Turn
        Start_AlreadyReady,
        Reset_BadPlayerCount,
        Reset_BadColor,

        // Supports
        Summon_NotAvailable,
        Summon_FieldFull,
        Summon_PortalNotAllowed,
        Pusher_AlreadyUsed,
        Pusher_NotOwnPusher,
        Push_NoActivePusher,
        Push_InvalidTarget
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<PieceId> piece{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> card_value{};
        std::optional<int> from_index{};
        std::optional<int> steps{};
        std::optional<std::uint8_t> occupants{};

        std::optional<Position> position{};
        std::optional<SupportType> support{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_piece(PieceId id) -> RuleViolation&
        {
            piece = id;
            return *this;
        }

        auto with_card(std::uint8_t v) -> RuleViolation&
        {
            card_value = v;
            return *this;
        }

        auto with_from(int idx) -> RuleViolation&
        {
            from_index = idx;
            return *this;
        }

        auto with_steps(int n) -> RuleViolation&
        {
            steps = n;
            return *this;
        }

        auto with_occupants(std::uint8_t n) -> RuleViolation&
        {
            occupants = n;
            return *this;
        }

        auto with_position(Position p) -> RuleViolation&
        {
            position = p;
            return *this;
        }

        auto with_support(SupportType t) -> RuleViolation&
        {
            support = t;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::GameAlreadyOver: return "Game is over";
        case E::TurnNotStarted: return "Turn not started (hotseat)";
        case E::WrongPhase_CardSelectionRequired: return "Wrong phase (card selection required)";
        case E::WrongPhase_SelectActionRequired: return "Wrong phase (select_action required)";
        case E::WrongPhase_PortalChoiceRequired: return "Wrong phase (portal_choice required)";
        case E::WrongPhase_PushTargetRequired: return "Wrong phase (select_push_target required)";
        case E::NoCardSelected: return "No card selected";
        case E::UnknownPiece: return "Unknown piece id";
        case E::NotOwnPiece: return "Piece not owned by current player";

        case E::Select_CardNotInHand: return "Select: card not in current hand";

        case E::Enter_NotHero: return "Enter: only the hero enters from home";
        case E::Enter_NotAtHome: return "Enter: piece is not at home";
        case E::Enter_StartAtCapacity: return "Enter: start cell at capacity";
        case E::Enter_StartHeldByOpponent: return "Enter: start cell held by opponent";
        case E::Enter_NoPortal: return "Enter: no claimed portal";
        case E::Enter_PortalOccupied: return "Enter: portal occupied";

        case E::Move_NotOnBoard: return "Move: piece not on board";
        case E::Move_PieceFinished: return "Move: piece already finished";
        case E::Move_Overshoot: return "Move: overshoots center";
        case E::Move_CellAtCapacity: return "Move: target cell at capacity";
        case E::Move_OwnPieceOnTarget: return "Move: own piece on target";

        case E::Portal_NothingPending: return "Portal: no pending portal";
        case E::Steal_NotAClaimedPortal: return "Steal: not a claimed portal";
        case E::Steal_OwnPortal: return "Steal: portal already owned";
        case E::Steal_NoOpposingPieceOnPortal: return "Steal: no opposing piece on portal";

        case E::Start_AlreadyReady: return "Start: turn already started";
        case E::Reset_BadPlayerCount: return "Reset: player count out of range";
        case E::Reset_BadColor: return "Reset: unknown color";

        case E::Summon_NotAvailable: return "Summon: subtype not available";
        case E::Summon_FieldFull: return "Summon: supports on field at cap";
        case E::Summon_PortalNotAllowed: return "Summon: portal entry not allowed";
        case E::Pusher_AlreadyUsed: return "Pusher: already used this turn";
        case E::Pusher_NotOwnPusher: return "Pusher: piece is not an own on-field pusher";
        case E::Push_NoActivePusher: return "Push: no active pusher";
        case E::Push_InvalidTarget: return "Push: target not pushable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.phase) s += fmt::format(" | phase={}", ::ludo::core::to_string(*v.phase));
        if (v.actor) s += fmt::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.piece) s += fmt::format(" | piece={}", *v.piece);
        if (v.card_value) s += fmt::format(" | card={}", static_cast<int>(*v.card_value));
        if (v.from_index) s += fmt::format(" | from={}", *v.from_index);
        if (v.steps) s += fmt::format(" | steps={}", *v.steps);
        if (v.occupants) s += fmt::format(" | occupants={}", static_cast<int>(*v.occupants));
        if (v.position) s += fmt::format(" | cell=({},{})", static_cast<int>(v.position->row),
                                         static_cast<int>(v.position->col));
        if (v.support) s += fmt::format(" | support={}", ::ludo::core::to_string(*v.support));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //LUDOPLUS_EXCEPTION_HPP
