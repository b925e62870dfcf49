#ifndef POKER_EQUITY_HAND_EVALUATOR_HPP
#define POKER_EQUITY_HAND_EVALUATOR_HPP

#include <vector>
#include <cstdint>
#include <string>
#include <optional>

#include "core/cards.hpp"

namespace poker_equity {

// Catégories de mains, de la plus faible à la plus forte
enum class HandCategory : uint8_t {
    HIGH_CARD       = 0,
    PAIR            = 1,
    TWO_PAIR        = 2,
    THREE_OF_A_KIND = 3,
    STRAIGHT        = 4,
    FLUSH           = 5,
    FULL_HOUSE      = 6,
    FOUR_OF_A_KIND  = 7,
    STRAIGHT_FLUSH  = 8,
    ROYAL_FLUSH     = 9
};

// Rangs (2-14) par ordre d'importance décroissante
using Tiebreakers = std::vector<int>;

struct EvaluatedHand {
    HandCategory category = HandCategory::HIGH_CARD;
    Tiebreakers  tiebreakers;

    bool operator==(const EvaluatedHand& other) const = default;
};

// --- Interface de l'évaluateur ---

/**
 * @brief Évalue la meilleure main de 5 cartes parmi 5 à 7 cartes.
 * @param cards Entre 5 et 7 cartes distinctes.
 * @return (catégorie, tiebreakers). Ex: KKK22 -> (FULL_HOUSE, [13, 2]).
 * @throws std::invalid_argument si le nombre de cartes est hors [5, 7],
 *         si une carte est invalide ou apparaît deux fois.
 */
EvaluatedHand evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Évalue 2 cartes privées + un board de 3 à 5 cartes.
 */
EvaluatedHand evaluate_hand(Card c1, Card c2, const std::vector<Card>& board);

/**
 * @brief Compare deux mains évaluées.
 * @return 1 si a gagne, -1 si b gagne, 0 en cas d'égalité.
 *
 * La catégorie domine ; à catégorie égale, les tiebreakers sont comparés
 * de gauche à droite. Une séquence épuisée donne une égalité.
 */
int compare_hands(const EvaluatedHand& a, const EvaluatedHand& b);

inline bool operator<(const EvaluatedHand& a, const EvaluatedHand& b) {
    return compare_hands(a, b) < 0;
}

inline bool operator>(const EvaluatedHand& a, const EvaluatedHand& b) {
    return compare_hands(a, b) > 0;
}

/**
 * @brief Reconstruit les 5 cartes qui forment la meilleure main.
 *
 * Ré-évaluer le résultat donne exactement le même EvaluatedHand que
 * l'évaluation des cartes d'origine. Pour la quinte blanche (wheel),
 * les cartes A-2-3-4-5 sont choisies.
 * @throws std::logic_error si la reconstruction échoue (bug interne).
 */
std::vector<Card> best_five_cards(const std::vector<Card>& cards);

// Hauteur de la plus haute quinte parmi les rangs (5 pour A-2-3-4-5)
std::optional<int> find_straight_high(const std::vector<int>& ranks);

std::string category_to_string(HandCategory category);
std::string hand_to_string(const EvaluatedHand& hand);

} // namespace poker_equity

#endif // POKER_EQUITY_HAND_EVALUATOR_HPP
