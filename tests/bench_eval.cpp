#include <catch2/catch_test_macros.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include "eval/hand_evaluator.hpp"
#include "poker_equity/equity_simulator.h"
#include "core/cards.hpp"
#include "core/deck.hpp"
#include <vector>

using namespace poker_equity;

TEST_CASE("Evaluate Performance", "[evaluator][!benchmark]") {
    Rng rng(2025);

    const int num_hands_to_eval = 10000;
    std::vector<std::vector<Card>> random_hands;
    random_hands.reserve(num_hands_to_eval);
    for (int i = 0; i < num_hands_to_eval; ++i) {
        Deck deck = fresh_shuffled_deck(EMPTY_BOARD, rng);
        random_hands.push_back(deck.deal(7));
    }

    BENCHMARK("Evaluate 10k Hands (7 Cards)") {
        int category_sum = 0;
        for (const auto& hand : random_hands) {
            category_sum += static_cast<int>(evaluate_hand(hand).category);
        }
        return category_sum;
    };

    BENCHMARK("Best five cards of 10k Hands") {
        std::size_t total = 0;
        for (const auto& hand : random_hands) {
            total += best_five_cards(hand).size();
        }
        return total;
    };
}

TEST_CASE("Simulator Performance", "[simulator][!benchmark]") {
    SimulatorConfig config;
    config.seed = 1;
    EquitySimulator single(config);
    config.num_threads = 0;
    EquitySimulator all_cores(config);
    const std::vector<Card> hole = cards_from_string("AhKh");

    BENCHMARK("5k trials, 3 opponents, 1 thread") {
        return single.estimate_equity(hole, {}, 3, 5000).win;
    };

    BENCHMARK("5k trials, 3 opponents, all cores") {
        return all_cores.estimate_equity(hole, {}, 3, 5000).win;
    };
}
