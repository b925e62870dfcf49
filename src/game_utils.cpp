#include "poker_equity/game_utils.hpp"
#include "core/cards.hpp"
#include <sstream>
#include <stdexcept>
#include <set>
#include <utility>   // Pour std::pair
#include <algorithm> // Pour std::minmax

namespace poker_equity {

namespace {

// Développe un token ("QQ", "AKs", "AKo", "AK", "AsKd") en combinaisons
std::vector<HoleCards> expand_token(const std::string& token) {
    std::vector<HoleCards> combos;

    if (token.size() == 4) {
        // Main précise
        const Card c1 = card_from_string(token.substr(0, 2));
        const Card c2 = card_from_string(token.substr(2, 2));
        if (c1 == c2) {
            throw std::invalid_argument("Range entry uses the same card twice: '" + token + "'");
        }
        combos.push_back({c1, c2});
        return combos;
    }

    if (token.size() != 2 && token.size() != 3) {
        throw std::invalid_argument("Invalid range token: '" + token + "'");
    }

    const Rank r1 = rank_from_char(token[0]);
    const Rank r2 = rank_from_char(token[1]);
    const char suffix = token.size() == 3 ? token[2] : '\0';
    if (suffix != '\0' && suffix != 's' && suffix != 'o') {
        throw std::invalid_argument("Invalid range suffix in '" + token + "' (expected 's' or 'o')");
    }

    if (r1 == r2) {
        if (suffix == 's') {
            throw std::invalid_argument("A pocket pair cannot be suited: '" + token + "'");
        }
        for (int s1 = 0; s1 < NUM_SUITS; ++s1) {
            for (int s2 = s1 + 1; s2 < NUM_SUITS; ++s2) {
                combos.push_back({make_card(r1, static_cast<Suit>(s1)), make_card(r2, static_cast<Suit>(s2))});
            }
        }
        return combos;
    }

    for (int s1 = 0; s1 < NUM_SUITS; ++s1) {
        for (int s2 = 0; s2 < NUM_SUITS; ++s2) {
            const bool suited = s1 == s2;
            if (suffix == 's' && !suited) continue;
            if (suffix == 'o' && suited) continue;
            combos.push_back({make_card(r1, static_cast<Suit>(s1)), make_card(r2, static_cast<Suit>(s2))});
        }
    }
    return combos;
}

} // namespace

std::string vec_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << (cards[i] == INVALID_CARD ? "--" : to_string(cards[i]));
        if (i + 1 < cards.size()) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

std::string hole_cards_to_string(const HoleCards& hole) {
    return to_string(hole[0]) + to_string(hole[1]);
}

std::vector<HoleCards> parse_range(const std::string& range) {
    std::vector<HoleCards> result;
    std::set<std::pair<Card, Card>> seen;

    std::string normalized = range;
    for (char& ch : normalized) {
        if (ch == ',') ch = ' ';
    }

    std::stringstream ss(normalized);
    std::string token;
    while (ss >> token) {
        for (const HoleCards& combo : expand_token(token)) {
            const auto key = std::minmax(combo[0], combo[1]);
            if (seen.insert(key).second) {
                result.push_back(combo);
            }
        }
    }
    return result;
}

} // namespace poker_equity
