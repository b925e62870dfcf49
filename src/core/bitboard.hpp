#ifndef POKER_EQUITY_BITBOARD_HPP
#define POKER_EQUITY_BITBOARD_HPP

#include <bit>      // Pour std::popcount, std::countr_zero
#include <cstdint>
#include <string>
#include <vector>

#include "core/cards.hpp"

namespace poker_equity {

// Ensemble de cartes : le bit c est à 1 ssi la carte c est présente.
// C'est la clé (rang, couleur) utilisée pour tous les tests d'appartenance.
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1;

inline void set_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) {
        board |= (1ULL << c);
    }
}

inline void clear_card(Bitboard& board, Card c) {
    if (c < INVALID_CARD) {
        board &= ~(1ULL << c);
    }
}

inline bool test_card(Bitboard board, Card c) {
    if (c >= INVALID_CARD) return false;
    return (board & (1ULL << c)) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Retire et retourne la carte du bit de poids faible (INVALID_CARD si vide)
inline Card pop_lsb(Bitboard& board) {
    if (board == EMPTY_BOARD) {
        return INVALID_CARD;
    }
    Card c = static_cast<Card>(std::countr_zero(board));
    board &= (board - 1);
    return c;
}

std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(const std::vector<Card>& cards);

// Vrai si une carte apparaît deux fois ou si une carte est invalide
bool has_duplicates(const std::vector<Card>& cards);

} // namespace poker_equity

#endif // POKER_EQUITY_BITBOARD_HPP
