#include "poker_equity/strategy.h"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace poker_equity {

double pot_odds(double pot_size, double call_amount) {
    if (pot_size < 0.0 || call_amount < 0.0) {
        throw std::invalid_argument("Pot size and call amount must be >= 0.");
    }
    if (pot_size + call_amount <= 0.0) {
        throw std::invalid_argument("Pot odds undefined for an empty pot and no call.");
    }
    return call_amount / (pot_size + call_amount);
}

double expected_value(double equity, double pot_size, double call_amount) {
    const double total_pot = pot_size + call_amount;
    return equity * total_pot - (1.0 - equity) * call_amount;
}

double breakeven_equity(double pot_size, double call_amount) {
    return pot_odds(pot_size, call_amount);
}

StrategyCalculator::StrategyCalculator(const EquitySimulator& simulator)
    : simulator_(simulator) {}

Decision StrategyCalculator::decide_from_result(const EquityResult& result,
                                                double pot_size,
                                                double call_amount) {
    Decision d;
    d.equity = result.equity();
    d.pot_odds = pot_odds(pot_size, call_amount);
    d.ev = expected_value(d.equity, pot_size, call_amount);
    d.profitable = d.ev > 0.0;

    if (call_amount == 0.0) {
        d.action = ActionType::CHECK;
    } else if (d.profitable) {
        d.action = ActionType::CALL;
    } else {
        d.action = ActionType::FOLD;
    }
    return d;
}

Decision StrategyCalculator::decide(const std::vector<Card>& player_cards,
                                    const std::vector<Card>& community_cards,
                                    double pot_size,
                                    double call_amount,
                                    int num_opponents,
                                    int trials) const {
    const EquityResult result = simulator_.estimate_equity(player_cards, community_cards, num_opponents, trials);
    Decision d = decide_from_result(result, pot_size, call_amount);
    spdlog::debug("StrategyCalculator: equity={:.3f} pot_odds={:.3f} ev={:.2f} -> {}",
                  d.equity, d.pot_odds, d.ev, action_to_string(d.action));
    return d;
}

} // namespace poker_equity
