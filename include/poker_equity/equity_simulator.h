#ifndef POKER_EQUITY_EQUITY_SIMULATOR_H
#define POKER_EQUITY_EQUITY_SIMULATOR_H

#include "poker_equity/common_types.h"
#include "core/cards.hpp"
#include "core/bitboard.hpp"
#include "core/deck.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace poker_equity {

// Compteurs d'un worker, sommés en fin de simulation
struct TrialCounts {
    long long wins = 0;
    long long ties = 0;
    long long losses = 0;

    long long total() const { return wins + ties + losses; }

    TrialCounts& operator+=(const TrialCounts& other) {
        wins += other.wins;
        ties += other.ties;
        losses += other.losses;
        return *this;
    }
};

struct TimingInfo {
    double time_seconds = 0.0;
    double trials_per_second = 0.0;
};

struct EquityResult {
    double    win = 0.0;
    double    tie = 0.0;
    double    loss = 0.0;
    long long trials = 0; // Essais effectivement comptés (0 si range vide)
    std::optional<TimingInfo> timing;

    // Équité au sens pot odds : les égalités comptent pour moitié
    double equity() const { return win + tie / 2.0; }
};

struct SimulatorConfig {
    int num_threads = 1;              // <= 0 : std::thread::hardware_concurrency()
    std::optional<uint64_t> seed;     // Sans graine : std::random_device
    bool measure_timing = false;
};

class EquitySimulator {
public:
    explicit EquitySimulator(SimulatorConfig config = {});

    // Équité contre `num_opponents` adversaires aléatoires.
    // Le joueur ne gagne l'essai que s'il bat tous les adversaires ; il perd
    // dès qu'un adversaire le bat ; sinon une égalité compte comme tie.
    EquityResult estimate_equity(const std::vector<Card>& player_cards,
                                 const std::vector<Card>& community_cards,
                                 int num_opponents,
                                 int trials) const;

    // Équité contre une range fixe. Les mains en conflit avec les cartes
    // connues sont ignorées ; si toutes le sont, le résultat vaut {0, 0, 0}.
    EquityResult estimate_range_equity(const std::vector<Card>& player_cards,
                                       const std::vector<HoleCards>& opponent_range,
                                       const std::vector<Card>& community_cards,
                                       int trials_per_hand) const;

    const SimulatorConfig& config() const { return config_; }
    int worker_count() const;

private:
    Bitboard validate_known_cards(const std::vector<Card>& player_cards,
                                  const std::vector<Card>& community_cards) const;

    template <typename TrialFn>
    TrialCounts run_trials(long long trials, uint64_t stream, TrialFn trial) const;

    EquityResult make_result(const TrialCounts& counts, double elapsed_seconds) const;

    SimulatorConfig config_;
};

} // namespace poker_equity

#endif // POKER_EQUITY_EQUITY_SIMULATOR_H
