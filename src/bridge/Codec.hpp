//
// Created by Malik T on 08/10/2025.
//

#ifndef LUDOPLUS_CODEC_HPP
#define LUDOPLUS_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>

#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "ludo_bridge_generated.h"

namespace ludo::core::bridge
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    // What an inbound action message decodes into
    struct DecodedAction
    {
        std::uint64_t msg_id{};
        PlyrIdxT actor{};
        PlayerAction action{};
    };

    auto ToFbColor(Color c) noexcept -> ludo::gen::bridge::Color;
    auto ToFbSupport(SupportType t) noexcept -> ludo::gen::bridge::SupportType;
    auto ToFbPhase(Phase p) noexcept -> ludo::gen::bridge::Phase;
    auto ToFbPieceType(PieceKind const& k) noexcept -> ludo::gen::bridge::PieceType;
    auto ToFbLogAction(LogAction a) noexcept -> ludo::gen::bridge::LogAction;

    auto FromFbColor(ludo::gen::bridge::Color c) noexcept -> Color;
    auto FromFbSupport(ludo::gen::bridge::SupportType t) noexcept -> SupportType;
    auto FromFbPhase(ludo::gen::bridge::Phase p) noexcept -> Phase;

    // --- Outbound (engine -> UI) ---

    // The whole state, every hand included; the UI decides what to show.
    auto BuildSnapshot(GameState const& s, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound (UI -> engine) ---

    auto BuildAction(PlyrIdxT actor, PlayerAction const& a, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it.
    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>;
} // namespace ludo::core::bridge

#endif //LUDOPLUS_CODEC_HPP
