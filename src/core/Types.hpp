//
// Created by Malik T on 14/08/2025.
//

#ifndef LUDOPLUS_TYPES_HPP
#define LUDOPLUS_TYPES_HPP

#define LUDO_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace ludo::core::constants
{
    inline constexpr int BoardSize = 7;
    inline constexpr int PathLength = 49;
    inline constexpr int CenterIndex = PathLength - 1;
    inline constexpr size_t HandSize = 3;
    inline constexpr size_t MaxSupportsOnField = 3;
    inline constexpr size_t MaxPiecesPerCell = 2;
    inline constexpr size_t ColorCount = 4;
    inline constexpr size_t SupportTypeCount = 4;
    inline constexpr uint8_t PortalMinCardValue = 3;
    inline constexpr int EscortBonus = 1;
    inline constexpr int AssassinBonus = 2;
    inline constexpr uint32_t MinPlayers = 2;
    inline constexpr uint32_t MaxPlayers = 4;
}

namespace ludo::core
{
    enum class Color : uint8_t
    {
        Red = 0,
        Blue,
        Green,
        Yellow
    };

    enum class SupportType : uint8_t
    {
        Escort = 0,
        Blocker,
        Assassin,
        Pusher
    };

    inline constexpr std::array<SupportType, constants::SupportTypeCount> AllSupportTypes{
        SupportType::Escort, SupportType::Blocker, SupportType::Assassin, SupportType::Pusher};

    struct Position
    {
        int8_t row{};
        int8_t col{};

        auto operator==(Position const&) const -> bool = default;
    };

    using PlyrIdxT = uint8_t;
    using PieceId = uint32_t;
    using CardId = uint32_t;

    struct Card
    {
        CardId id{};
        uint8_t value{};

        auto operator==(Card const&) const -> bool = default;
    };

    // A hero can never carry a support subtype: the kind is a closed sum.
    struct Hero
    {
        auto operator==(Hero const&) const -> bool = default;
    };
    struct Support
    {
        SupportType type{};
        auto operator==(Support const&) const -> bool = default;
    };
    using PieceKind = std::variant<Hero, Support>;

    struct Piece
    {
        PieceId id{};
        PlyrIdxT owner{};
        Color color{};
        PieceKind kind{Hero{}};
        std::optional<Position> position{}; // nullopt = home
        int path_index{-1};                 // -1 = home
        bool finished{false};

        [[nodiscard]]
        auto IsHero() const noexcept -> bool { return std::holds_alternative<Hero>(kind); }

        [[nodiscard]]
        auto SupportKind() const noexcept -> std::optional<SupportType>
        {
            if (auto const* s = std::get_if<Support>(&kind)) return s->type;
            return std::nullopt;
        }

        [[nodiscard]]
        auto IsSupport(SupportType t) const noexcept -> bool { return SupportKind() == t; }

        [[nodiscard]]
        auto OnBoard() const noexcept -> bool { return position.has_value() && !finished; }

        auto operator==(Piece const&) const -> bool = default;
    };

    struct PlayerInfo
    {
        PlyrIdxT seat{};
        Color color{};
        std::string name;
        bool is_ai{false};

        auto operator==(PlayerInfo const&) const -> bool = default;
    };

    struct Config
    {
        uint32_t n_players{4};
        Color    human_color{Color::Red};
        bool     hotseat{false};
        uint64_t seed{std::random_device{}()};
        // false = a destroyed support's subtype is lost for the rest of the game
        bool     recycle_fallen_supports{true};
        // print every rejected action with its violation
        bool     log_violations{false};

        auto operator==(Config const&) const -> bool = default;
    };
}

#endif //LUDOPLUS_TYPES_HPP
