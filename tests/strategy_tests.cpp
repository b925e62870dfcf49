#include "poker_equity/strategy.h"
#include "poker_equity/equity_simulator.h"
#include "core/cards.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>

using namespace poker_equity;
using Catch::Approx;

TEST_CASE("Pot odds and expected value", "[strategy]") {
    SECTION("pot_odds") {
        REQUIRE(pot_odds(100.0, 25.0) == Approx(0.20));
        REQUIRE(pot_odds(100.0, 0.0) == Approx(0.0));
        REQUIRE(breakeven_equity(100.0, 50.0) == Approx(50.0 / 150.0));
        REQUIRE_THROWS_AS(pot_odds(0.0, 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(pot_odds(-10.0, 5.0), std::invalid_argument);
    }

    SECTION("expected_value") {
        // 55% d'équité, pot 100, call 25 : 0.55 * 125 - 0.45 * 25
        REQUIRE(expected_value(0.55, 100.0, 25.0) == Approx(57.5));
        REQUIRE(expected_value(0.0, 100.0, 25.0) == Approx(-25.0));
        REQUIRE(expected_value(1.0, 100.0, 25.0) == Approx(125.0));
    }
}

TEST_CASE("Decision from a simulation result", "[strategy]") {
    EquityResult strong;
    strong.win = 0.80;
    strong.tie = 0.04;
    strong.loss = 0.16;

    EquityResult hopeless;
    hopeless.win = 0.0;
    hopeless.tie = 0.0;
    hopeless.loss = 1.0;

    SECTION("Checks when nothing is owed") {
        Decision d = StrategyCalculator::decide_from_result(hopeless, 100.0, 0.0);
        REQUIRE(d.action == ActionType::CHECK);
        REQUIRE(d.ev == Approx(0.0));
    }

    SECTION("Calls with a positive EV") {
        Decision d = StrategyCalculator::decide_from_result(strong, 100.0, 25.0);
        REQUIRE(d.equity == Approx(0.82));
        REQUIRE(d.pot_odds == Approx(0.20));
        REQUIRE(d.profitable);
        REQUIRE(d.action == ActionType::CALL);
    }

    SECTION("Folds with a negative EV") {
        Decision d = StrategyCalculator::decide_from_result(hopeless, 100.0, 25.0);
        REQUIRE_FALSE(d.profitable);
        REQUIRE(d.action == ActionType::FOLD);
    }
}

TEST_CASE("StrategyCalculator runs the simulator", "[strategy][simulator]") {
    SimulatorConfig config;
    config.seed = 3;
    EquitySimulator simulator(config);
    StrategyCalculator calculator(simulator);

    SECTION("The nuts on the river calls") {
        Decision d = calculator.decide(cards_from_string("AsKs"), cards_from_string("QsJsTs2c3d"),
                                       100.0, 50.0, 1, 200);
        REQUIRE(d.equity == Approx(1.0));
        REQUIRE(d.action == ActionType::CALL);
    }

    SECTION("Drawing dead folds") {
        Decision d = calculator.decide(cards_from_string("2c3d"), cards_from_string("AsKsQsJs9h"),
                                       100.0, 50.0, 1, 200);
        // Le board joue au mieux : égalité possible, victoire impossible
        REQUIRE(d.equity < 0.5);
        REQUIRE(d.action == ActionType::FOLD);
    }
}
