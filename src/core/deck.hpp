#ifndef POKER_EQUITY_CORE_DECK_HPP
#define POKER_EQUITY_CORE_DECK_HPP

#include "core/cards.hpp"
#include "core/bitboard.hpp"
#include <vector>
#include <random>
#include <cstddef>

namespace poker_equity {

// Générateur utilisé pour les mélanges. Chaque worker possède le sien.
using Rng = std::mt19937_64;

// Paquet de cartes possédé par un seul essai de simulation.
// Le paquet ne contient pas de générateur : le mélange utilise celui de l'appelant.
class Deck {
public:
    Deck();                            // 52 cartes ordonnées
    explicit Deck(Bitboard dead_cards); // 52 cartes moins les cartes connues
    ~Deck() = default;

    Card deal_card();
    std::vector<Card> deal(std::size_t n);
    void shuffle(Rng& rng);

    std::size_t size() const { return cards_.size(); }
    std::size_t remaining() const { return cards_.size() - next_card_index_; }
    const std::vector<Card>& cards() const { return cards_; }

private:
    std::vector<Card> cards_;
    std::size_t       next_card_index_ = 0;
};

// Nouveau paquet sans les cartes connues, déjà mélangé
Deck fresh_shuffled_deck(Bitboard dead_cards, Rng& rng);

} // namespace poker_equity

#endif // POKER_EQUITY_CORE_DECK_HPP
