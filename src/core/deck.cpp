#include "core/deck.hpp"
#include "core/bitboard.hpp"
#include <stdexcept>
#include <algorithm> // Pour std::shuffle
#include <string>

namespace poker_equity {

Deck::Deck()
    : Deck(EMPTY_BOARD)
{
}

Deck::Deck(Bitboard dead_cards) {
    cards_.reserve(NUM_CARDS - count_set_bits(dead_cards & FULL_DECK));
    for (int c = 0; c < NUM_CARDS; ++c) {
        Card card = static_cast<Card>(c);
        if (!test_card(dead_cards, card)) {
            cards_.push_back(card);
        }
    }
}

Card Deck::deal_card() {
    if (next_card_index_ >= cards_.size()) {
        throw std::runtime_error("Deck is empty, cannot deal card.");
    }
    return cards_[next_card_index_++];
}

std::vector<Card> Deck::deal(std::size_t n) {
    if (n > remaining()) {
        throw std::runtime_error("Cannot deal " + std::to_string(n) + " cards, only " +
                                 std::to_string(remaining()) + " left in deck.");
    }
    std::vector<Card> dealt(cards_.begin() + next_card_index_,
                            cards_.begin() + next_card_index_ + n);
    next_card_index_ += n;
    return dealt;
}

void Deck::shuffle(Rng& rng) {
    // Remélanger tout le paquet, pas juste la partie non distribuée
    std::shuffle(cards_.begin(), cards_.end(), rng);
    next_card_index_ = 0;
}

Deck fresh_shuffled_deck(Bitboard dead_cards, Rng& rng) {
    Deck deck(dead_cards);
    deck.shuffle(rng);
    return deck;
}

} // namespace poker_equity
