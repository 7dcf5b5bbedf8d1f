//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp: seeded all-AI match runner
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "core/Game.hpp"
#include "core/StandardRules.hpp"
#include "core/RandomAi.hpp"
#include "core/SimpleAi.hpp"
#include "core/Exception.hpp"
#include "core/Names.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Invariants.hpp"
#include "debug/RecordingPlayer.hpp"

namespace
{
    struct MatchConfig
    {
        std::uint32_t n_players{4};
        std::uint64_t seed{123456789ULL};
        ludo::core::Color color{ludo::core::Color::Red};
        bool          hotseat{false};
        bool          random_ai{false};
        std::uint64_t max_steps{20000};
        std::string   audit_path{};
        bool          strict_losses{false};
        bool          verbose{false};
    };

    auto ParseColor(std::string_view s) -> std::optional<ludo::core::Color>
    {
        using ludo::core::Color;
        if (s == "red") return Color::Red;
        if (s == "blue") return Color::Blue;
        if (s == "green") return Color::Green;
        if (s == "yellow") return Color::Yellow;
        return std::nullopt;
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<MatchConfig>
    {
        MatchConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            std::uint64_t v{};
            if (arg == "--players")
            {
                if (!next_uint(v)) return std::nullopt;
                cfg.n_players = static_cast<std::uint32_t>(v);
            }
            else if (arg == "--seed")
            {
                if (!next_uint(v)) return std::nullopt;
                cfg.seed = v;
            }
            else if (arg == "--max-steps")
            {
                if (!next_uint(v)) return std::nullopt;
                cfg.max_steps = v;
            }
            else if (arg == "--color")
            {
                if (i + 1 >= argc) return std::nullopt;
                std::optional<ludo::core::Color> const c = ParseColor(argv[++i]);
                if (!c) return std::nullopt;
                cfg.color = *c;
            }
            else if (arg == "--audit")
            {
                if (i + 1 >= argc) return std::nullopt;
                cfg.audit_path = argv[++i];
            }
            else if (arg == "--ai")
            {
                if (i + 1 >= argc) return std::nullopt;
                std::string_view const kind = argv[++i];
                if (kind != "simple" && kind != "random") return std::nullopt;
                cfg.random_ai = kind == "random";
            }
            else if (arg == "--hotseat") { cfg.hotseat = true; }
            else if (arg == "--strict-losses") { cfg.strict_losses = true; }
            else if (arg == "--verbose") { cfg.verbose = true; }
            else { return std::nullopt; }
        }
        return cfg;
    }

    auto PrintLine(ludo::core::LogEntry const& e) -> void
    {
        using namespace ludo::core;
        std::string line = fmt::format("#{:<4} {:<8} {}", e.id, e.player_name, to_string(e.action));
        if (e.piece) line += fmt::format(" {}", to_string(*e.piece));
        if (e.card_value) line += fmt::format(" [{}]", static_cast<int>(*e.card_value));
        if (e.target_player) line += fmt::format(" -> {}", *e.target_player);
        if (e.target_piece) line += fmt::format(" ({})", to_string(*e.target_piece));
        fmt::print("{}\n", line);
    }
}

int main(int argc, char** argv)
{
    using namespace ludo;
    using namespace ludo::core;

    std::optional<MatchConfig> const parsed = ParseArgs(argc, argv);
    if (!parsed)
    {
        fmt::print(stderr,
                   "usage: ludo_match [--players 2-4] [--seed N] [--color red|blue|green|yellow] [--hotseat]\n"
                   "                  [--ai simple|random] [--max-steps N] [--audit FILE] [--strict-losses] [--verbose]\n");
        return 2;
    }
    MatchConfig const& mc = *parsed;

    Config cfg;
    cfg.n_players               = mc.n_players;
    cfg.human_color             = mc.color;
    cfg.hotseat                 = mc.hotseat;
    cfg.seed                    = mc.seed;
    cfg.recycle_fallen_supports = !mc.strict_losses;
    cfg.log_violations          = mc.verbose;

    // every seat is driven by a policy, including the "human" one
    std::vector<std::unique_ptr<Player>> players;
    players.reserve(mc.n_players);
    for (std::uint32_t i = 0; i < mc.n_players; ++i)
    {
        if (mc.random_ai)
            players.emplace_back(std::make_unique<RandomAI>(mc.seed + static_cast<uint64_t>(i * 1337u)));
        else
            players.emplace_back(std::make_unique<SimpleAI>());
    }
    players = debug::WrapRecording(players);

    try
    {
        GameImpl game(cfg, std::make_unique<StandardRules>(), std::move(players));

        std::optional<debug::AuditLogger> audit;
        if (!mc.audit_path.empty())
        {
            audit.emplace(mc.audit_path);
            audit->start(*game.State(), mc.seed);
        }

        fmt::print("[ludo] {} player(s), seed {}\n", game.PlayerCount(), mc.seed);

        MoveOutcome outcome = MoveOutcome::Applied;
        std::uint64_t steps{};
        std::size_t printed{};

        while (outcome != MoveOutcome::GameEnded && steps < mc.max_steps)
        {
            std::shared_ptr<GameState const> const before = game.State();
            PlyrIdxT const actor = before->current;

            outcome = game.Step();
            ++steps;
            debug::CheckInvariants(*game.State());

            if (audit)
            {
                auto* rec = debug::AsRecording(game.PlayerAt(actor));
                if (rec && rec->HasLast()) audit->turn(*before, rec->Last());
                audit->outcome(outcome);
                audit->events(*game.State(), before->log.size());
            }

            std::vector<LogEntry> const& log = game.State()->log;
            for (; printed < log.size(); ++printed) PrintLine(log[printed]);

            if (outcome == MoveOutcome::AwaitingInput) break;
        }

        GameState const& end = *game.State();
        if (audit) audit->end(end);

        if (end.winner)
        {
            PlayerInfo const& w = end.players.at(*end.winner);
            fmt::print("[ludo] {} ({}) wins after {} steps\n", w.name, to_string(w.color), steps);
        }
        else
        {
            fmt::print("[ludo] no winner after {} steps\n", steps);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "[ludo] engine error: {}\n{}", e.what(), e.to_str());
        return 1;
    }

    return 0;
}
