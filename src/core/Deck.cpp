//
// Created by Malik T on 30/09/2025.
//

#include "Deck.hpp"

#include <algorithm>
#include <utility>

namespace ludo::core
{
    auto CreateDeck(CardId& next_id, RngT& rng) -> std::vector<Card>
    {
        std::vector<Card> deck;
        deck.reserve(DeckSize);
        for (auto const [value, count] : DeckComposition)
        {
            for (uint8_t i{}; i < count; ++i)
            {
                deck.push_back(Card{.id = next_id++, .value = value});
            }
        }
        std::ranges::shuffle(deck, rng);
        return deck;
    }

    auto CreatePlayerHand(PlyrIdxT owner, CardId& next_id, RngT& rng) -> Hand
    {
        Hand hand{};
        hand.owner = owner;
        hand.deck = CreateDeck(next_id, rng);
        hand.cards.assign(hand.deck.begin(), hand.deck.begin() + constants::HandSize);
        hand.deck.erase(hand.deck.begin(), hand.deck.begin() + constants::HandSize);
        return hand;
    }

    auto DrawCard(Hand hand, RngT& rng) -> Hand
    {
        if (hand.deck.empty() && !hand.discard.empty())
        {
            hand.deck = std::move(hand.discard);
            hand.discard.clear();
            std::ranges::shuffle(hand.deck, rng);
        }
        if (hand.deck.empty()) return hand; // nothing left anywhere

        hand.cards.push_back(hand.deck.front());
        hand.deck.erase(hand.deck.begin());
        return hand;
    }

    auto PlayCard(Hand hand, CardId id) -> Hand
    {
        auto const it = std::ranges::find(hand.cards, id, &Card::id);
        if (it == hand.cards.end()) return hand;

        hand.discard.push_back(*it);
        hand.cards.erase(it);
        return hand;
    }

    auto RefreshHand(Hand hand, RngT& rng) -> Hand
    {
        hand.discard.insert(hand.discard.end(), hand.cards.begin(), hand.cards.end());
        hand.cards.clear();
        for (size_t i{}; i < constants::HandSize; ++i)
        {
            hand = DrawCard(std::move(hand), rng);
        }
        return hand;
    }

    auto FindCard(Hand const& hand, CardId id) -> std::optional<Card>
    {
        auto const it = std::ranges::find(hand.cards, id, &Card::id);
        if (it == hand.cards.end()) return std::nullopt;
        return *it;
    }

    auto TotalCards(Hand const& hand) noexcept -> size_t
    {
        return hand.cards.size() + hand.deck.size() + hand.discard.size();
    }
}
