//
// Created by Malik T on 15/08/2025.
//
#include "Game.hpp"

#include <utility>

#include <fmt/format.h>

#include "Names.hpp"
#include "StandardRules.hpp"

namespace ludo::core
{
    auto Transit(Rules const& rules, GameState const& prev, PlayerAction const& a) -> Transition
    {
        if (auto const ok = rules.Validate(prev, a); !ok.has_value())
            return Transition{prev, MoveOutcome::Invalid, ok.error()};

        GameState next = prev;
        rules.Apply(next, a);
        MoveOutcome const outcome = rules.Advance(next);
        return Transition{std::move(next), outcome, std::nullopt};
    }

    auto Reduce(GameState const& prev, PlayerAction const& a) -> GameState
    {
        static StandardRules const rules{};
        return Transit(rules, prev, a).state;
    }

    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(std::move(players)),
        state_(std::make_shared<GameState const>(MakeInitialState(cfg_)))
    {
        LUDO_ASSERT(rules_ != nullptr, "Null rules while initialising core");
    }

    auto GameImpl::PlayerAt(PlyrIdxT seat) const -> Player*
    {
        return seat < players_.size() ? players_[seat].get() : nullptr;
    }

    auto GameImpl::Dispatch(PlayerAction const& a) -> MoveOutcome
    {
        Transition t = Transit(*rules_, *state_, a);
        last_violation_ = std::move(t.violation);
        if (t.outcome == MoveOutcome::Invalid)
        {
            if (cfg_.log_violations)
                fmt::print("[{}] rejected {}: {}\n", state_->CurrentPlayer().name, to_string(a),
                           error::describe(*last_violation_));
            return MoveOutcome::Invalid;
        }
        state_ = std::make_shared<GameState const>(std::move(t.state));
        return t.outcome;
    }

    auto GameImpl::Step() -> MoveOutcome
    {
        if (state_->phase == Phase::GameOver)
            return MoveOutcome::GameEnded;

        Player* const policy = PlayerAt(state_->current);
        if (!policy)
            return MoveOutcome::AwaitingInput;

        std::optional<PlayerAction> const action = policy->Play(state_);
        if (!action)
            return MoveOutcome::Invalid;
        return Dispatch(*action);
    }
}
