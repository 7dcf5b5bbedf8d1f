//
// Created by Malik T on 20/08/2025.
//

#ifndef LUDOPLUS_AUDITLOGGER_HPP
#define LUDOPLUS_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace ludo::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, seats)
        auto start(GameState const& s, std::uint64_t seed) -> void;

        // Per step (before dispatch): state the action was proposed against
        auto turn(GameState const& s, PlayerAction const& a) -> void;

        // Per step outcome (after dispatch)
        auto outcome(MoveOutcome m) -> void;

        // Log lines appended by the last transition
        auto events(GameState const& s, std::size_t from) -> void;

        // Game end footer (winner seat; -1 if none)
        auto end(GameState const& s) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //LUDOPLUS_AUDITLOGGER_HPP
