//
// Created by malikt on 8/20/25.
//

#ifndef LUDOPLUS_RECORDINGPLAYER_HPP
#define LUDOPLUS_RECORDINGPLAYER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace ludo::core::debug
{
    // Remembers every action the wrapped policy proposed, in order.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<GameState const> s) -> std::optional<PlayerAction> override
        {
            std::optional<PlayerAction> a = inner_->Play(std::move(s));
            if (a) history_.push_back(*a);
            return a;
        }

        auto HasLast() const -> bool
        {
            return !history_.empty();
        }

        auto Last() const -> PlayerAction const&
        {
            return history_.back();
        }

        auto History() const -> std::vector<PlayerAction> const&
        {
            return history_;
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<PlayerAction> history_;
    };

    // Helper to wrap a vector<unique_ptr<Player>>; null seats stay null
    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            if (p)
                out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
            else
                out.emplace_back();
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace ludo::core::debug

#endif //LUDOPLUS_RECORDINGPLAYER_HPP
