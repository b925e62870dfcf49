// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur 5-7 cartes par analyse des comptes de rangs et de couleurs.
//  Les tiebreakers retournés permettent de reconstruire la meilleure main
//  de 5 cartes sans refaire l'évaluation (best_five_cards).
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "core/bitboard.hpp"
#include "core/cards.hpp"
#include <stdexcept>
#include <algorithm>
#include <array>
#include <functional>   // Pour std::greater
#include <sstream>

namespace poker_equity {

namespace {

constexpr int MIN_HAND_SIZE = 5;
constexpr int MAX_HAND_SIZE = 7;
constexpr int NO_SUIT = -1;

struct HandAnalysis {
    std::vector<int>   ranks;        // Rangs bruts, décroissants
    int                flush_suit = NO_SUIT;
    std::vector<int>   flush_ranks;  // Tous les rangs de la couleur, décroissants
    std::optional<int> straight_high;
    std::vector<int>   fours;
    std::vector<int>   triples;
    std::vector<int>   pairs;
    std::vector<int>   kickers;      // Rangs présents une seule fois
};

void validate_hand(const std::vector<Card>& cards) {
    const int n = static_cast<int>(cards.size());
    if (n < MIN_HAND_SIZE || n > MAX_HAND_SIZE) {
        throw std::invalid_argument("Hand must contain between 5 and 7 cards, got " +
                                    std::to_string(n) + ".");
    }
    if (has_duplicates(cards)) {
        throw std::invalid_argument("Hand contains an invalid or duplicated card.");
    }
}

HandAnalysis analyse(const std::vector<Card>& cards) {
    HandAnalysis a;
    std::array<int, NUM_SUITS> suit_counts{};
    std::array<int, MAX_RANK + 1> rank_counts{};

    a.ranks.reserve(cards.size());
    for (Card c : cards) {
        a.ranks.push_back(rank_value(c));
        ++suit_counts[suit_index(c)];
        ++rank_counts[rank_value(c)];
    }
    std::sort(a.ranks.begin(), a.ranks.end(), std::greater<int>());

    // Avec 7 cartes et 4 couleurs, une seule couleur peut atteindre 5
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (suit_counts[s] >= 5) {
            a.flush_suit = s;
            break;
        }
    }
    if (a.flush_suit != NO_SUIT) {
        for (Card c : cards) {
            if (suit_index(c) == a.flush_suit) a.flush_ranks.push_back(rank_value(c));
        }
        std::sort(a.flush_ranks.begin(), a.flush_ranks.end(), std::greater<int>());
    }

    a.straight_high = find_straight_high(a.ranks);

    // Parcours décroissant : chaque groupe est déjà trié
    for (int r = MAX_RANK; r >= MIN_RANK; --r) {
        switch (rank_counts[r]) {
            case 4: a.fours.push_back(r); break;
            case 3: a.triples.push_back(r); break;
            case 2: a.pairs.push_back(r); break;
            case 1: a.kickers.push_back(r); break;
            default: break;
        }
    }
    return a;
}

// Meilleur rang restant, en excluant les rangs déjà utilisés
int best_rank_excluding(const std::vector<int>& ranks_desc, std::initializer_list<int> excluded) {
    for (int r : ranks_desc) {
        if (std::find(excluded.begin(), excluded.end(), r) == excluded.end()) return r;
    }
    throw std::logic_error("No kicker available outside the made hand.");
}

Tiebreakers top_n(const std::vector<int>& ranks, std::size_t n) {
    return Tiebreakers(ranks.begin(), ranks.begin() + std::min(n, ranks.size()));
}

// Rangs de la quinte de hauteur `high`, du plus haut au plus bas
std::vector<int> straight_ranks(int high) {
    if (high == 5) return {5, 4, 3, 2, 14};
    return {high, high - 1, high - 2, high - 3, high - 4};
}

// Prend `count` cartes de rang `rank` (et de couleur `suit` si précisée)
// qui ne sont pas encore dans `chosen`.
void take_cards(const std::vector<Card>& cards, int rank, int count, int suit,
                std::vector<Card>& chosen) {
    int taken = 0;
    for (Card c : cards) {
        if (taken == count) break;
        if (rank_value(c) != rank) continue;
        if (suit != NO_SUIT && suit_index(c) != suit) continue;
        if (std::find(chosen.begin(), chosen.end(), c) != chosen.end()) continue;
        chosen.push_back(c);
        ++taken;
    }
    if (taken != count) {
        throw std::logic_error("Cannot rebuild best hand: missing card of rank " +
                               std::to_string(rank) + ".");
    }
}

int flush_suit_of(const std::vector<Card>& cards) {
    std::array<int, NUM_SUITS> suit_counts{};
    for (Card c : cards) ++suit_counts[suit_index(c)];
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (suit_counts[s] >= 5) return s;
    }
    throw std::logic_error("Flush category without a five-card suit.");
}

} // namespace

std::optional<int> find_straight_high(const std::vector<int>& ranks) {
    std::vector<int> unique_ranks = ranks;
    std::sort(unique_ranks.begin(), unique_ranks.end(), std::greater<int>());
    unique_ranks.erase(std::unique(unique_ranks.begin(), unique_ranks.end()), unique_ranks.end());

    if (unique_ranks.size() < 5) return std::nullopt;

    for (std::size_t i = 0; i + 4 < unique_ranks.size(); ++i) {
        if (unique_ranks[i] - unique_ranks[i + 4] == 4) {
            return unique_ranks[i];
        }
    }

    // Quinte blanche A-2-3-4-5 : l'As compte pour 1, la hauteur est 5
    auto has = [&](int r) {
        return std::find(unique_ranks.begin(), unique_ranks.end(), r) != unique_ranks.end();
    };
    if (has(14) && has(2) && has(3) && has(4) && has(5)) {
        return 5;
    }
    return std::nullopt;
}

EvaluatedHand evaluate_hand(const std::vector<Card>& cards) {
    validate_hand(cards);
    const HandAnalysis a = analyse(cards);
    const bool flush = a.flush_suit != NO_SUIT;

    // La quinte doit être dans la couleur : on recalcule sur les rangs de la couleur
    if (flush) {
        std::optional<int> flush_straight = find_straight_high(a.flush_ranks);
        if (flush_straight) {
            if (*flush_straight == MAX_RANK) {
                return {HandCategory::ROYAL_FLUSH, {MAX_RANK}};
            }
            return {HandCategory::STRAIGHT_FLUSH, {*flush_straight}};
        }
    }

    if (!a.fours.empty()) {
        const int quad = a.fours.front();
        return {HandCategory::FOUR_OF_A_KIND, {quad, best_rank_excluding(a.ranks, {quad})}};
    }

    if (!a.triples.empty() && !a.pairs.empty()) {
        return {HandCategory::FULL_HOUSE, {a.triples[0], a.pairs[0]}};
    }
    if (a.triples.size() >= 2) {
        // Le brelan inférieur joue le rôle de la paire
        return {HandCategory::FULL_HOUSE, {a.triples[0], a.triples[1]}};
    }

    if (flush) {
        return {HandCategory::FLUSH, top_n(a.flush_ranks, 5)};
    }

    if (a.straight_high) {
        return {HandCategory::STRAIGHT, {*a.straight_high}};
    }

    if (!a.triples.empty()) {
        Tiebreakers t{a.triples[0]};
        Tiebreakers k = top_n(a.kickers, 2);
        t.insert(t.end(), k.begin(), k.end());
        return {HandCategory::THREE_OF_A_KIND, t};
    }

    if (a.pairs.size() >= 2) {
        const int high = a.pairs[0];
        const int low = a.pairs[1];
        // Une troisième paire peut servir de kicker
        return {HandCategory::TWO_PAIR, {high, low, best_rank_excluding(a.ranks, {high, low})}};
    }

    if (!a.pairs.empty()) {
        Tiebreakers t{a.pairs[0]};
        Tiebreakers k = top_n(a.kickers, 3);
        t.insert(t.end(), k.begin(), k.end());
        return {HandCategory::PAIR, t};
    }

    return {HandCategory::HIGH_CARD, top_n(a.ranks, 5)};
}

EvaluatedHand evaluate_hand(Card c1, Card c2, const std::vector<Card>& board) {
    std::vector<Card> cards;
    cards.reserve(board.size() + 2);
    cards.push_back(c1);
    cards.push_back(c2);
    cards.insert(cards.end(), board.begin(), board.end());
    return evaluate_hand(cards);
}

int compare_hands(const EvaluatedHand& a, const EvaluatedHand& b) {
    if (a.category > b.category) return 1;
    if (a.category < b.category) return -1;

    const std::size_t n = std::min(a.tiebreakers.size(), b.tiebreakers.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (a.tiebreakers[i] > b.tiebreakers[i]) return 1;
        if (a.tiebreakers[i] < b.tiebreakers[i]) return -1;
    }
    return 0;
}

std::vector<Card> best_five_cards(const std::vector<Card>& cards) {
    const EvaluatedHand hand = evaluate_hand(cards);
    const Tiebreakers& t = hand.tiebreakers;
    std::vector<Card> best;
    best.reserve(5);

    switch (hand.category) {
        case HandCategory::ROYAL_FLUSH:
        case HandCategory::STRAIGHT_FLUSH: {
            const int suit = flush_suit_of(cards);
            for (int r : straight_ranks(t[0])) take_cards(cards, r, 1, suit, best);
            break;
        }
        case HandCategory::FOUR_OF_A_KIND:
            take_cards(cards, t[0], 4, NO_SUIT, best);
            take_cards(cards, t[1], 1, NO_SUIT, best);
            break;
        case HandCategory::FULL_HOUSE:
            take_cards(cards, t[0], 3, NO_SUIT, best);
            take_cards(cards, t[1], 2, NO_SUIT, best);
            break;
        case HandCategory::FLUSH: {
            const int suit = flush_suit_of(cards);
            for (int r : t) take_cards(cards, r, 1, suit, best);
            break;
        }
        case HandCategory::STRAIGHT:
            for (int r : straight_ranks(t[0])) take_cards(cards, r, 1, NO_SUIT, best);
            break;
        case HandCategory::THREE_OF_A_KIND:
            take_cards(cards, t[0], 3, NO_SUIT, best);
            take_cards(cards, t[1], 1, NO_SUIT, best);
            take_cards(cards, t[2], 1, NO_SUIT, best);
            break;
        case HandCategory::TWO_PAIR:
            take_cards(cards, t[0], 2, NO_SUIT, best);
            take_cards(cards, t[1], 2, NO_SUIT, best);
            take_cards(cards, t[2], 1, NO_SUIT, best);
            break;
        case HandCategory::PAIR:
            take_cards(cards, t[0], 2, NO_SUIT, best);
            for (std::size_t i = 1; i < t.size(); ++i) take_cards(cards, t[i], 1, NO_SUIT, best);
            break;
        case HandCategory::HIGH_CARD:
            for (int r : t) take_cards(cards, r, 1, NO_SUIT, best);
            break;
        default:
            throw std::logic_error("Unhandled hand category in best_five_cards: " +
                                   std::to_string(static_cast<int>(hand.category)));
    }

    if (best.size() != 5) {
        throw std::logic_error("best_five_cards produced " + std::to_string(best.size()) + " cards.");
    }
    return best;
}

std::string category_to_string(HandCategory category) {
    switch (category) {
        case HandCategory::HIGH_CARD:       return "High Card";
        case HandCategory::PAIR:            return "One Pair";
        case HandCategory::TWO_PAIR:        return "Two Pair";
        case HandCategory::THREE_OF_A_KIND: return "Three of a Kind";
        case HandCategory::STRAIGHT:        return "Straight";
        case HandCategory::FLUSH:           return "Flush";
        case HandCategory::FULL_HOUSE:      return "Full House";
        case HandCategory::FOUR_OF_A_KIND:  return "Four of a Kind";
        case HandCategory::STRAIGHT_FLUSH:  return "Straight Flush";
        case HandCategory::ROYAL_FLUSH:     return "Royal Flush";
        default:                            return "Unknown";
    }
}

std::string hand_to_string(const EvaluatedHand& hand) {
    std::stringstream ss;
    ss << category_to_string(hand.category) << " [";
    for (std::size_t i = 0; i < hand.tiebreakers.size(); ++i) {
        ss << hand.tiebreakers[i] << (i + 1 == hand.tiebreakers.size() ? "" : ", ");
    }
    ss << "]";
    return ss.str();
}

} // namespace poker_equity
