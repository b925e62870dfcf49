#include "poker_equity/equity_simulator.h"
#include "poker_equity/strategy.h"
#include "poker_equity/game_utils.hpp"
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/cfg/env.h"

#include <iostream>   // std::cerr
#include <string>     // std::string
#include <vector>     // std::vector
#include <exception>  // std::exception

// Usage : poker_equity_cli <main> [board|-] [adversaires] [essais] [threads]
//   ex.   poker_equity_cli AsAh "Kd7c2s" 2 20000 4
int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging (SPDLOG_LEVEL=debug pour le détail de la simulation)
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    // ─────────────────────────────────────────────────────────────
    // Paramètres par défaut
    // ─────────────────────────────────────────────────────────────
    std::string hole_text     = "AsAh";
    std::string board_text    = "";
    int         num_opponents = 1;
    int         num_trials    = 10000;
    int         num_threads   = 0;      // 0 : tous les cœurs
    const double pot_size     = 100.0;
    const double call_amount  = 25.0;

    try
    {
        if (argc > 1) hole_text = argv[1];
        if (argc > 2) board_text = std::string(argv[2]) == "-" ? "" : argv[2];
        if (argc > 3) num_opponents = std::stoi(argv[3]);
        if (argc > 4) num_trials = std::stoi(argv[4]);
        if (argc > 5) num_threads = std::stoi(argv[5]);

        const std::vector<poker_equity::Card> hole = poker_equity::cards_from_string(hole_text);
        const std::vector<poker_equity::Card> board = poker_equity::cards_from_string(board_text);

        spdlog::info("Main {} | Board {} | {} adversaire(s) | {} essais",
                     poker_equity::vec_to_string(hole), poker_equity::vec_to_string(board),
                     num_opponents, num_trials);

        // 1. Meilleure main actuelle (dès le flop)
        if (hole.size() + board.size() >= 5)
        {
            std::vector<poker_equity::Card> all = hole;
            all.insert(all.end(), board.begin(), board.end());
            const auto evaluated = poker_equity::evaluate_hand(all);
            spdlog::info("Main actuelle : {} {}", poker_equity::hand_to_string(evaluated),
                         poker_equity::vec_to_string(poker_equity::best_five_cards(all)));
        }

        // 2. Simulation
        poker_equity::SimulatorConfig config;
        config.num_threads = num_threads;
        config.measure_timing = true;
        poker_equity::EquitySimulator simulator(config);

        const poker_equity::EquityResult result =
            simulator.estimate_equity(hole, board, num_opponents, num_trials);

        spdlog::info("Win {:.2f}% | Tie {:.2f}% | Loss {:.2f}%",
                     result.win * 100.0, result.tie * 100.0, result.loss * 100.0);
        if (result.timing)
            spdlog::info("Durée {:.3f}s ({:.0f} essais/s, {} worker(s))",
                         result.timing->time_seconds, result.timing->trials_per_second,
                         simulator.worker_count());

        // 3. Recommandation pour un call de 25 dans un pot de 100
        const poker_equity::Decision decision =
            poker_equity::StrategyCalculator::decide_from_result(result, pot_size, call_amount);
        spdlog::info("Pot {} / call {} : equity {:.3f}, cote {:.3f}, EV {:.2f} -> {}",
                     pot_size, call_amount, decision.equity, decision.pot_odds, decision.ev,
                     poker_equity::action_to_string(decision.action));
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    return 0;
}
