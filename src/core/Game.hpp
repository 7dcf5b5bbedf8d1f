//
// Created by Malik T on 15/08/2025.
//

#ifndef LUDOPLUS_GAME_HPP
#define LUDOPLUS_GAME_HPP

#include <memory>
#include <optional>
#include <vector>

#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"

namespace ludo::core
{
    struct Transition
    {
        GameState state;
        MoveOutcome outcome{MoveOutcome::Invalid};
        std::optional<error::RuleViolation> violation{};
    };

    // Validate against `prev`, then apply and advance on a copy.
    // A rejected action yields a copy of `prev` and the violation.
    auto Transit(Rules const& rules, GameState const& prev, PlayerAction const& a) -> Transition;

    // The reducer with the standard rule set: (state, action) -> state.
    auto Reduce(GameState const& prev, PlayerAction const& a) -> GameState;

    class GameImpl
    {
    public:
        GameImpl() = delete;
        // players may be shorter than the seat count; missing or null seats are driven by Dispatch.
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players);

        // Validates and applies one action for the current seat.
        auto Dispatch(PlayerAction const& a) -> MoveOutcome;

        // Asks the current seat's policy for an action and dispatches it.
        auto Step() -> MoveOutcome;

        auto State() const noexcept -> std::shared_ptr<GameState const> { return state_; }
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }
        auto PlayerAt(PlyrIdxT seat) const -> Player*;
        auto PhaseNow() const noexcept -> Phase { return state_->phase; }
        auto Current() const noexcept -> PlyrIdxT { return state_->current; }
        auto PlayerCount() const noexcept -> size_t { return state_->PlayerCount(); }

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Player>> players_;

        // the only reference to the current state; replaced wholesale per dispatch
        std::shared_ptr<GameState const> state_;
        std::optional<error::RuleViolation> last_violation_{};
    };
}
#endif //LUDOPLUS_GAME_HPP
