#ifndef POKER_EQUITY_CARDS_HPP
#define POKER_EQUITY_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace poker_equity {

// Une carte est un index 0-51 (suit * 13 + (rank - 2)).
// Deux cartes sont égales ssi rang ET couleur sont égaux.
using Card = uint8_t;

// Carte invalide/inconnue
constexpr Card INVALID_CARD = 52;

enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// Rangs sur l'échelle 2-14 (11=Valet, 12=Dame, 13=Roi, 14=As)
enum class Rank : uint8_t {
    TWO = 2, THREE = 3, FOUR = 4, FIVE = 5, SIX = 6, SEVEN = 7, EIGHT = 8,
    NINE = 9, TEN = 10, JACK = 11, QUEEN = 12, KING = 13, ACE = 14
};

constexpr int MIN_RANK = 2;
constexpr int MAX_RANK = 14;
constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<Card>(static_cast<uint8_t>(s) * NUM_RANKS +
                             (static_cast<uint8_t>(r) - MIN_RANK));
}

constexpr Card make_card(int rank, int suit) {
    return static_cast<Card>(suit * NUM_RANKS + (rank - MIN_RANK));
}

constexpr Rank get_rank(Card c) {
    return static_cast<Rank>(c % NUM_RANKS + MIN_RANK);
}

constexpr Suit get_suit(Card c) {
    return static_cast<Suit>(c / NUM_RANKS);
}

// Rang entier 2-14, utilisé pour les tiebreakers
constexpr int rank_value(Card c) {
    return c % NUM_RANKS + MIN_RANK;
}

constexpr int suit_index(Card c) {
    return c / NUM_RANKS;
}

// Conversions string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

// Affichage avec symboles unicode ("A♠")
std::string to_pretty_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// "AsKd Qh" -> {As, Kd, Qh}. Les espaces entre les cartes sont optionnels.
std::vector<Card> cards_from_string(const std::string& s);

} // namespace poker_equity

#endif // POKER_EQUITY_CARDS_HPP
