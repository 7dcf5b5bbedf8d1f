//
// Created by Malik T on 30/09/2025.
//

#ifndef LUDOPLUS_DECK_HPP
#define LUDOPLUS_DECK_HPP

#include <array>
#include <optional>
#include <random>
#include <utility>
#include <vector>

#include "Types.hpp"

namespace ludo::core
{
    using RngT = std::mt19937_64;

    // card value -> copies in a fresh deck
    inline constexpr std::array<std::pair<uint8_t, uint8_t>, 6> DeckComposition{{
        {1, 4}, {2, 4}, {3, 3}, {4, 3}, {5, 2}, {6, 2}
    }};
    inline constexpr size_t DeckSize = 18;

    struct Hand
    {
        PlyrIdxT owner{};
        std::vector<Card> cards;   // held
        std::vector<Card> deck;    // draw pile, front is drawn first
        std::vector<Card> discard;

        auto operator==(Hand const&) const -> bool = default;
    };

    // Cards get ids next_id, next_id+1, ...; next_id is advanced past them.
    auto CreateDeck(CardId& next_id, RngT& rng) -> std::vector<Card>;
    auto CreatePlayerHand(PlyrIdxT owner, CardId& next_id, RngT& rng) -> Hand;

    // Reshuffles the discard into the deck when the deck is empty; no-op when both are.
    auto DrawCard(Hand hand, RngT& rng) -> Hand;
    // Unknown id -> hand returned unchanged.
    auto PlayCard(Hand hand, CardId id) -> Hand;
    // Discards the held cards then draws back up to HandSize.
    auto RefreshHand(Hand hand, RngT& rng) -> Hand;

    auto FindCard(Hand const& hand, CardId id) -> std::optional<Card>;
    auto TotalCards(Hand const& hand) noexcept -> size_t;
}

#endif //LUDOPLUS_DECK_HPP
