// tests/equity_simulator_tests.cpp
#include "poker_equity/equity_simulator.h"
#include "poker_equity/game_utils.hpp"
#include "core/cards.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <stdexcept>
#include <vector>

using namespace poker_equity;
using Catch::Matchers::WithinAbs;

namespace {

SimulatorConfig seeded(uint64_t seed, int threads = 1) {
    SimulatorConfig config;
    config.seed = seed;
    config.num_threads = threads;
    return config;
}

} // namespace

TEST_CASE("estimate_equity - pocket aces preflop", "[simulator][equity]") {
    EquitySimulator simulator(seeded(1234));
    EquityResult r = simulator.estimate_equity(cards_from_string("AsAh"), {}, 1, 10000);

    REQUIRE(r.trials == 10000);
    REQUIRE(r.win >= 0.75);
    REQUIRE(r.win <= 0.95);
    REQUIRE_THAT(r.win + r.tie + r.loss, WithinAbs(1.0, 1e-9));
    REQUIRE_FALSE(r.timing.has_value());
}

TEST_CASE("estimate_equity - more opponents lowers the win rate", "[simulator][equity]") {
    EquitySimulator simulator(seeded(99));
    EquityResult heads_up = simulator.estimate_equity(cards_from_string("AsAh"), {}, 1, 5000);
    EquityResult multiway = simulator.estimate_equity(cards_from_string("AsAh"), {}, 4, 5000);

    REQUIRE(multiway.win < heads_up.win);
    REQUIRE_THAT(multiway.win + multiway.tie + multiway.loss, WithinAbs(1.0, 1e-9));
}

TEST_CASE("estimate_equity - complete boards", "[simulator][equity]") {
    EquitySimulator simulator(seeded(7));

    SECTION("Royal flush on the river always wins") {
        EquityResult r = simulator.estimate_equity(cards_from_string("AsKs"),
                                                   cards_from_string("QsJsTs 2c 3d"), 3, 500);
        REQUIRE(r.win == 1.0);
        REQUIRE(r.tie == 0.0);
        REQUIRE(r.loss == 0.0);
    }

    SECTION("Royal flush on the board is always shared") {
        EquityResult r = simulator.estimate_equity(cards_from_string("2c3d"),
                                                   cards_from_string("AsKsQsJsTs"), 2, 500);
        REQUIRE(r.tie == 1.0);
    }
}

TEST_CASE("estimate_equity - seeded runs are reproducible", "[simulator][parallel]") {
    const std::vector<Card> hole = cards_from_string("KdQd");
    const std::vector<Card> board = cards_from_string("Jd7c2d");

    SECTION("Single thread") {
        EquityResult a = EquitySimulator(seeded(42)).estimate_equity(hole, board, 2, 3000);
        EquityResult b = EquitySimulator(seeded(42)).estimate_equity(hole, board, 2, 3000);
        REQUIRE(a.win == b.win);
        REQUIRE(a.tie == b.tie);
        REQUIRE(a.loss == b.loss);
    }

    SECTION("Four workers") {
        EquityResult a = EquitySimulator(seeded(42, 4)).estimate_equity(hole, board, 2, 3001);
        EquityResult b = EquitySimulator(seeded(42, 4)).estimate_equity(hole, board, 2, 3001);
        REQUIRE(a.trials == 3001);
        REQUIRE(a.win == b.win);
        REQUIRE(a.loss == b.loss);
    }

    SECTION("Parallel and sequential estimates agree statistically") {
        EquityResult seq = EquitySimulator(seeded(5, 1)).estimate_equity(hole, board, 1, 20000);
        EquityResult par = EquitySimulator(seeded(6, 4)).estimate_equity(hole, board, 1, 20000);
        REQUIRE_THAT(par.win, WithinAbs(seq.win, 0.03));
        REQUIRE_THAT(par.win + par.tie + par.loss, WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("estimate_equity - timing instrumentation", "[simulator][timing]") {
    SimulatorConfig config = seeded(11);
    config.measure_timing = true;
    EquitySimulator timed(config);
    EquitySimulator plain(seeded(11));

    EquityResult with_timing = timed.estimate_equity(cards_from_string("7h7c"), {}, 1, 2000);
    EquityResult without = plain.estimate_equity(cards_from_string("7h7c"), {}, 1, 2000);

    REQUIRE(with_timing.timing.has_value());
    REQUIRE(with_timing.timing->time_seconds >= 0.0);
    REQUIRE(with_timing.timing->trials_per_second >= 0.0);
    // L'instrumentation ne change pas le résultat statistique
    REQUIRE(with_timing.win == without.win);
    REQUIRE(with_timing.tie == without.tie);
}

TEST_CASE("estimate_equity - invalid input", "[simulator][errors]") {
    EquitySimulator simulator(seeded(1));
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("As"), {}, 1, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsAs"), {}, 1, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsKs"), cards_from_string("Ks2c3c"), 1, 10),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsKs"), cards_from_string("2c3c4c5c6c7c"), 1, 10),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsKs"), {}, 0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsKs"), {}, 1, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(simulator.estimate_equity(cards_from_string("AsKs"), {}, 24, 10), std::invalid_argument);
}

TEST_CASE("estimate_range_equity", "[simulator][range]") {
    EquitySimulator simulator(seeded(77));
    const std::vector<Card> aces = cards_from_string("AsAh");

    SECTION("Every entry conflicting gives an all-zero result") {
        std::vector<HoleCards> range = parse_range("AsKd, AhQc, 2cAs");
        EquityResult r = simulator.estimate_range_equity(aces, range, {}, 100);
        REQUIRE(r.win == 0.0);
        REQUIRE(r.tie == 0.0);
        REQUIRE(r.loss == 0.0);
        REQUIRE(r.trials == 0);
    }

    SECTION("Empty range gives an all-zero result") {
        EquityResult r = simulator.estimate_range_equity(aces, {}, {}, 100);
        REQUIRE(r.trials == 0);
        REQUIRE(r.win == 0.0);
    }

    SECTION("Conflicting entries contribute no trials") {
        std::vector<HoleCards> range = parse_range("AsKd KcKh");
        EquityResult r = simulator.estimate_range_equity(aces, range, {}, 250);
        REQUIRE(r.trials == 250);
    }

    SECTION("Entries conflicting with the board are skipped") {
        std::vector<HoleCards> range = parse_range("QQ");
        EquityResult r = simulator.estimate_range_equity(aces, range, cards_from_string("Qs7c2d"), 50);
        // 3 des 6 combinaisons de QQ contiennent la Qs
        REQUIRE(r.trials == 3 * 50);
    }

    SECTION("Complete board with a dominated range") {
        std::vector<HoleCards> range = parse_range("QQ");
        EquityResult r = simulator.estimate_range_equity(aces, range, cards_from_string("2c7d9hJsKc"), 20);
        REQUIRE(r.trials == 6 * 20);
        REQUIRE(r.win == 1.0);
    }

    SECTION("Aces against kings preflop") {
        std::vector<HoleCards> range = parse_range("KK");
        EquityResult r = simulator.estimate_range_equity(aces, range, {}, 1000);
        REQUIRE(r.trials == 6000);
        REQUIRE(r.win > 0.7);
        REQUIRE(r.win < 0.9);
        REQUIRE_THAT(r.win + r.tie + r.loss, WithinAbs(1.0, 1e-9));
    }

    SECTION("Range entry with the same card twice is rejected") {
        std::vector<HoleCards> range = {HoleCards{card_from_string("Kd"), card_from_string("Kd")}};
        REQUIRE_THROWS_AS(simulator.estimate_range_equity(aces, range, {}, 10), std::invalid_argument);
    }

    SECTION("Parallel range run counts every trial") {
        EquitySimulator parallel(seeded(77, 3));
        std::vector<HoleCards> range = parse_range("KK, AKs");
        EquityResult r = parallel.estimate_range_equity(aces, range, {}, 100);
        // AKs : seules Kc-Ac et Kd-Ad ne touchent pas AsAh
        REQUIRE(r.trials == (6 + 2) * 100);
    }
}
