#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include <sstream>

namespace poker_equity {

std::string board_to_string(Bitboard board) {
    // pop_lsb retourne les cartes par index croissant : affichage stable
    std::stringstream ss;
    for (Card c : board_to_cards(board)) {
        ss << to_string(c);
    }
    return ss.str();
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board));
    while (board != EMPTY_BOARD) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(const std::vector<Card>& cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        set_card(board, c);
    }
    return board;
}

bool has_duplicates(const std::vector<Card>& cards) {
    Bitboard seen = EMPTY_BOARD;
    for (Card c : cards) {
        if (c >= INVALID_CARD || test_card(seen, c)) {
            return true;
        }
        set_card(seen, c);
    }
    return false;
}

} // namespace poker_equity
