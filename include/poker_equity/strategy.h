#ifndef POKER_EQUITY_STRATEGY_H
#define POKER_EQUITY_STRATEGY_H

#include "poker_equity/common_types.h"
#include "poker_equity/equity_simulator.h"
#include "core/cards.hpp"
#include <vector>

namespace poker_equity {

// Cote du pot : part du pot final que représente le call (25 / (100 + 25) = 0.20)
double pot_odds(double pot_size, double call_amount);

// EV d'un call : equity * (pot + call) - (1 - equity) * call
double expected_value(double equity, double pot_size, double call_amount);

// Équité minimale pour qu'un call soit rentable (égale à la cote du pot)
double breakeven_equity(double pot_size, double call_amount);

struct Decision {
    ActionType action = ActionType::FOLD;
    double     equity = 0.0;
    double     pot_odds = 0.0;
    double     ev = 0.0;
    bool       profitable = false;
};

class StrategyCalculator {
public:
    explicit StrategyCalculator(const EquitySimulator& simulator);

    // Lance une simulation puis recommande check / call / fold
    Decision decide(const std::vector<Card>& player_cards,
                    const std::vector<Card>& community_cards,
                    double pot_size,
                    double call_amount,
                    int num_opponents,
                    int trials) const;

    // Même décision à partir d'un résultat de simulation déjà calculé
    static Decision decide_from_result(const EquityResult& result, double pot_size, double call_amount);

private:
    const EquitySimulator& simulator_;
};

} // namespace poker_equity

#endif // POKER_EQUITY_STRATEGY_H
