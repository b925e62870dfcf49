#include "poker_equity/equity_simulator.h"
#include "poker_equity/game_utils.hpp"   // Pour vec_to_string
#include "eval/hand_evaluator.hpp"
#include "core/deck.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <random>
#include <stdexcept>
#include <thread>

namespace poker_equity {

namespace {

constexpr int HOLE_CARDS = 2;
constexpr int BOARD_CARDS = 5;

enum class TrialOutcome { WIN, TIE, LOSS };

using SeedWords = std::array<uint32_t, 4>;

} // namespace

EquitySimulator::EquitySimulator(SimulatorConfig config)
    : config_(config) {}

int EquitySimulator::worker_count() const {
    if (config_.num_threads > 0) return config_.num_threads;
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

Bitboard EquitySimulator::validate_known_cards(const std::vector<Card>& player_cards,
                                               const std::vector<Card>& community_cards) const {
    if (player_cards.size() != HOLE_CARDS) {
        throw std::invalid_argument("Player hand must contain exactly 2 cards.");
    }
    if (community_cards.size() > BOARD_CARDS) {
        throw std::invalid_argument("Board cannot contain more than 5 cards.");
    }
    std::vector<Card> known = player_cards;
    known.insert(known.end(), community_cards.begin(), community_cards.end());
    if (has_duplicates(known)) {
        throw std::invalid_argument("Known cards contain an invalid or duplicated card: " +
                                    vec_to_string(known));
    }
    return cards_to_board(known);
}

// Répartit les essais entre workers. Chaque worker possède son générateur
// et ses paquets ; seuls les compteurs sont réduits après join().
template <typename TrialFn>
TrialCounts EquitySimulator::run_trials(long long trials, uint64_t stream, TrialFn trial) const {
    const int workers = static_cast<int>(std::min<long long>(worker_count(), trials));

    // Graines préparées dans le thread appelant (random_device n'est pas partagé)
    std::vector<SeedWords> seeds(workers);
    if (config_.seed) {
        const uint64_t seed = *config_.seed;
        for (int w = 0; w < workers; ++w) {
            seeds[w] = {static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                        static_cast<uint32_t>(stream), static_cast<uint32_t>(w)};
        }
    } else {
        std::random_device rd;
        for (auto& words : seeds) {
            words = {rd(), rd(), rd(), rd()};
        }
    }

    std::vector<TrialCounts> partial(workers);
    std::vector<std::exception_ptr> errors(workers);

    auto worker_fn = [&](int w) {
        try {
            std::seed_seq seq(seeds[w].begin(), seeds[w].end());
            Rng rng(seq);
            const long long share = trials / workers + (w < trials % workers ? 1 : 0);
            TrialCounts& counts = partial[w];
            for (long long i = 0; i < share; ++i) {
                switch (trial(rng)) {
                    case TrialOutcome::WIN:  ++counts.wins; break;
                    case TrialOutcome::TIE:  ++counts.ties; break;
                    case TrialOutcome::LOSS: ++counts.losses; break;
                }
            }
            spdlog::trace("EquitySimulator: worker {} a terminé {} essais.", w, share);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    if (workers == 1) {
        worker_fn(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back(worker_fn, w);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }

    TrialCounts total;
    for (const auto& counts : partial) {
        total += counts;
    }
    return total;
}

EquityResult EquitySimulator::make_result(const TrialCounts& counts, double elapsed_seconds) const {
    EquityResult result;
    result.trials = counts.total();
    if (result.trials > 0) {
        const double n = static_cast<double>(result.trials);
        result.win = static_cast<double>(counts.wins) / n;
        result.tie = static_cast<double>(counts.ties) / n;
        result.loss = static_cast<double>(counts.losses) / n;
    }
    if (config_.measure_timing) {
        TimingInfo timing;
        timing.time_seconds = elapsed_seconds;
        timing.trials_per_second = elapsed_seconds > 0.0
            ? static_cast<double>(result.trials) / elapsed_seconds
            : 0.0;
        result.timing = timing;
    }
    return result;
}

EquityResult EquitySimulator::estimate_equity(const std::vector<Card>& player_cards,
                                              const std::vector<Card>& community_cards,
                                              int num_opponents,
                                              int trials) const {
    const Bitboard dead = validate_known_cards(player_cards, community_cards);
    if (num_opponents < 1) {
        throw std::invalid_argument("At least one opponent is required.");
    }
    if (trials < 1) {
        throw std::invalid_argument("Number of trials must be >= 1.");
    }

    const int board_needed = BOARD_CARDS - static_cast<int>(community_cards.size());
    const int cards_to_deal = num_opponents * HOLE_CARDS + board_needed;
    const int deck_size = NUM_CARDS - count_set_bits(dead);
    if (cards_to_deal > deck_size) {
        throw std::invalid_argument("Not enough cards left (" + std::to_string(deck_size) +
                                    ") to deal " + std::to_string(num_opponents) + " opponents.");
    }

    spdlog::debug("EquitySimulator: {} essais, joueur {}, board {}, {} adversaire(s), {} worker(s).",
                  trials, vec_to_string(player_cards), vec_to_string(community_cards),
                  num_opponents, std::min(worker_count(), trials));

    auto trial = [&](Rng& rng) {
        // Paquet neuf et mélange neuf à chaque essai
        Deck deck = fresh_shuffled_deck(dead, rng);
        const std::vector<Card> dealt = deck.deal(static_cast<std::size_t>(cards_to_deal));

        std::vector<Card> board = community_cards;
        board.insert(board.end(), dealt.begin() + num_opponents * HOLE_CARDS, dealt.end());

        const EvaluatedHand player = evaluate_hand(player_cards[0], player_cards[1], board);
        bool tied = false;
        for (int i = 0; i < num_opponents; ++i) {
            const EvaluatedHand opponent = evaluate_hand(dealt[i * HOLE_CARDS], dealt[i * HOLE_CARDS + 1], board);
            const int cmp = compare_hands(player, opponent);
            if (cmp < 0) return TrialOutcome::LOSS;
            if (cmp == 0) tied = true;
        }
        return tied ? TrialOutcome::TIE : TrialOutcome::WIN;
    };

    const auto start = std::chrono::steady_clock::now();
    const TrialCounts counts = run_trials(trials, 0, trial);
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    EquityResult result = make_result(counts, elapsed.count());
    spdlog::debug("EquitySimulator: win={:.4f} tie={:.4f} loss={:.4f}", result.win, result.tie, result.loss);
    return result;
}

EquityResult EquitySimulator::estimate_range_equity(const std::vector<Card>& player_cards,
                                                    const std::vector<HoleCards>& opponent_range,
                                                    const std::vector<Card>& community_cards,
                                                    int trials_per_hand) const {
    const Bitboard dead = validate_known_cards(player_cards, community_cards);
    if (trials_per_hand < 1) {
        throw std::invalid_argument("Number of trials per hand must be >= 1.");
    }

    const int board_needed = BOARD_CARDS - static_cast<int>(community_cards.size());
    const auto start = std::chrono::steady_clock::now();
    TrialCounts total;
    std::size_t skipped = 0;

    for (std::size_t h = 0; h < opponent_range.size(); ++h) {
        const HoleCards& opp = opponent_range[h];
        if (opp[0] >= INVALID_CARD || opp[1] >= INVALID_CARD || opp[0] == opp[1]) {
            throw std::invalid_argument("Invalid opponent range entry: " + hole_cards_to_string(opp));
        }
        if (test_card(dead, opp[0]) || test_card(dead, opp[1])) {
            spdlog::trace("EquitySimulator: main {} ignorée (conflit avec les cartes connues).",
                          hole_cards_to_string(opp));
            ++skipped;
            continue;
        }

        Bitboard hand_dead = dead;
        set_card(hand_dead, opp[0]);
        set_card(hand_dead, opp[1]);

        auto trial = [&](Rng& rng) {
            Deck deck = fresh_shuffled_deck(hand_dead, rng);
            std::vector<Card> board = community_cards;
            const std::vector<Card> runout = deck.deal(static_cast<std::size_t>(board_needed));
            board.insert(board.end(), runout.begin(), runout.end());

            const int cmp = compare_hands(evaluate_hand(player_cards[0], player_cards[1], board),
                                          evaluate_hand(opp[0], opp[1], board));
            if (cmp > 0) return TrialOutcome::WIN;
            if (cmp == 0) return TrialOutcome::TIE;
            return TrialOutcome::LOSS;
        };

        // Un flux de graines distinct par entrée de la range
        total += run_trials(trials_per_hand, h + 1, trial);
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    if (total.total() == 0) {
        spdlog::warn("EquitySimulator: les {} mains de la range sont en conflit avec les cartes connues ; "
                     "résultat nul.", opponent_range.size());
    } else {
        spdlog::debug("EquitySimulator: range de {} mains, {} ignorée(s), {} essais.",
                      opponent_range.size(), skipped, total.total());
    }
    return make_result(total, elapsed.count());
}

} // namespace poker_equity
