#include "core/cards.hpp"
#include <stdexcept>
#include <cctype>
#include <map> // Pour la conversion char -> Rank/Suit

namespace poker_equity {

namespace {

const std::map<char, Rank> CHAR_TO_RANK = {
    {'2', Rank::TWO}, {'3', Rank::THREE}, {'4', Rank::FOUR}, {'5', Rank::FIVE},
    {'6', Rank::SIX}, {'7', Rank::SEVEN}, {'8', Rank::EIGHT}, {'9', Rank::NINE},
    {'T', Rank::TEN}, {'J', Rank::JACK}, {'Q', Rank::QUEEN}, {'K', Rank::KING},
    {'A', Rank::ACE}
};
const std::map<char, Suit> CHAR_TO_SUIT = {
    {'c', Suit::CLUBS}, {'d', Suit::DIAMONDS}, {'h', Suit::HEARTS}, {'s', Suit::SPADES}
};

constexpr const char* RANK_CHARS = "23456789TJQKA";
constexpr const char* SUIT_CHARS = "cdhs";
const char* const SUIT_SYMBOLS[NUM_SUITS] = {"♣", "♦", "♥", "♠"};

} // namespace

Rank rank_from_char(char r) {
    auto it = CHAR_TO_RANK.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (it == CHAR_TO_RANK.end()) {
        throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
    }
    return it->second;
}

Suit suit_from_char(char s) {
    auto it = CHAR_TO_SUIT.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (it == CHAR_TO_SUIT.end()) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return it->second;
}

std::string to_string(Rank r) {
    int idx = static_cast<int>(r) - MIN_RANK;
    if (idx < 0 || idx >= NUM_RANKS) return "?";
    return std::string(1, RANK_CHARS[idx]);
}

std::string to_string(Suit s) {
    int idx = static_cast<int>(s);
    if (idx < 0 || idx >= NUM_SUITS) return "?";
    return std::string(1, SUIT_CHARS[idx]);
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

std::string to_pretty_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_rank(c)) + SUIT_SYMBOLS[suit_index(c)];
}

Card card_from_string(const std::string& s) {
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

std::vector<Card> cards_from_string(const std::string& s) {
    std::vector<Card> cards;
    std::string token;
    for (char ch : s) {
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
            if (!token.empty()) {
                throw std::invalid_argument("Dangling character in card list: '" + s + "'");
            }
            continue;
        }
        token.push_back(ch);
        if (token.size() == 2) {
            cards.push_back(card_from_string(token));
            token.clear();
        }
    }
    if (!token.empty()) {
        throw std::invalid_argument("Incomplete card at end of list: '" + s + "'");
    }
    return cards;
}

} // namespace poker_equity
