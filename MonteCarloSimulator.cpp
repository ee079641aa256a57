#include "MonteCarloSimulator.h"
#include "Statistics.h"
#include <iomanip>
#include <chrono>
#include <cmath>
#include <algorithm>
#include <omp.h>
#include <atomic>
#include <exception>
#include <string>
#include <limits>
#include <utility>

// Rounds per independently seeded stream when a plain run goes parallel
static const long long kParallelBatchSize = 10000;

static bool isWin(const MontyHall::RoundResult& result) {
    return result.outcome == MontyHall::Outcome::Win;
}

// --- MonteCarloSimulator Method Implementations ---

MonteCarloSimulator::MonteCarloSimulator() {
    unsigned seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    m_rng.seed(seed);
}

MonteCarloSimulator::MonteCarloSimulator(std::mt19937::result_type seed) : m_rng(seed) {}

void MonteCarloSimulator::setPrecision(int decimals) {
    if (decimals < 0 || decimals > 10) {
        throw MontyHall::InvalidArgument("Precision must be between 0 and 10 decimal places, got "
                                         + std::to_string(decimals) + ".");
    }
    m_precision = decimals;
    std::cout << "[Config] Proportions will be rounded to " << decimals << " decimal places." << std::endl;
}

void MonteCarloSimulator::run(long long numGames, bool useParallel) {
    if (numGames < 1) {
        throw MontyHall::InvalidArgument("Number of games must be at least 1, got "
                                         + std::to_string(numGames) + ".");
    }
    if (numGames > std::numeric_limits<long long>::max() / 2) {
        throw MontyHall::InvalidArgument("Too many rounds requested: " + std::to_string(numGames) + ".");
    }

    RunTally tally;
    if (!useParallel) {
        std::cout << "\n[Monitor] Running in SINGLE-THREADED mode." << std::endl;
        runSingleThread(numGames, numGames, tally);
    } else {
        std::cout << "\n[Monitor] Running in PARALLEL mode." << std::endl;
        runParallel(numGames, kParallelBatchSize, tally);
    }
    m_batch_result = analyzeResults(tally, numGames, 0);
}

void MonteCarloSimulator::run(long long k, long long m, bool useParallel) {
    if (k < 1 || m < 1) {
        throw MontyHall::InvalidArgument("Batch count (k) and rounds per batch (m) must both be at least 1, got k="
                                         + std::to_string(k) + ", m=" + std::to_string(m) + ".");
    }
    // 2 * k * m results are stored, so that product must fit as well
    if (m > std::numeric_limits<long long>::max() / 2 / k) {
        throw MontyHall::InvalidArgument("Too many rounds requested: " + std::to_string(k) + " batches × "
                                         + std::to_string(m) + " rounds/batch.");
    }

    const long long numGames = k * m;
    std::cout << "[Monitor] Configuration: " << k << " batches × " << m << " rounds/batch = "
              << numGames << " total rounds" << std::endl;

    RunTally tally;
    if (!useParallel) {
        std::cout << "\n[Monitor] Running in SINGLE-THREADED mode." << std::endl;
        runSingleThread(numGames, m, tally);
    } else {
        std::cout << "\n[Monitor] Running in PARALLEL mode." << std::endl;
        runParallel(numGames, m, tally);
    }
    m_batch_result = analyzeResults(tally, numGames, k);
}

// --- Runners ---

void MonteCarloSimulator::runSingleThread(long long numGames, long long batchSize, RunTally& tally) {
    std::cout << "[Monitor] Starting simulation of " << numGames << " rounds." << std::endl;
    auto start_sim_time = std::chrono::high_resolution_clock::now();

    std::vector<MontyHall::RoundResult>& results = tally.results;
    results.reserve(2 * numGames);

    const long long progress_interval = numGames > 20 ? numGames / 20 : 1;
    long long batch_stay_wins = 0;
    long long batch_switch_wins = 0;
    long long batch_rounds = 0;

    for (long long i = 0; i < numGames; ++i) {
        MontyHall::RoundReport round = MontyHall::playRound(m_rng);
        results.push_back(round.stay);
        results.push_back(round.switched);

        if (isWin(round.stay)) { tally.stay_wins++; batch_stay_wins++; }
        if (isWin(round.switched)) { tally.switch_wins++; batch_switch_wins++; }

        if (++batch_rounds == batchSize || i + 1 == numGames) {
            tally.stay_batch_means.push_back(static_cast<double>(batch_stay_wins) / batch_rounds);
            tally.switch_batch_means.push_back(static_cast<double>(batch_switch_wins) / batch_rounds);
            batch_stay_wins = 0;
            batch_switch_wins = 0;
            batch_rounds = 0;
        }

        if ((i + 1) % progress_interval == 0) {
            std::cout << "          ... Progress: " << (100 * (i + 1) / numGames) << "% complete." << std::endl;
        }
    }

    std::chrono::duration<double> sim_elapsed = std::chrono::high_resolution_clock::now() - start_sim_time;
    std::cout << "[Monitor] Simulation loop finished in " << sim_elapsed.count() << " seconds." << std::endl;
}

// Each batch owns an rng seeded from the master rng in batch order, so the outcome
// does not depend on the thread count or on how OpenMP schedules the batches.
void MonteCarloSimulator::runParallel(long long numGames, long long batchSize, RunTally& tally) {
    std::cout << "[Monitor] Starting parallel simulation of " << numGames << " rounds." << std::endl;
    auto start_sim_time = std::chrono::high_resolution_clock::now();

    const long long numBatches = (numGames + batchSize - 1) / batchSize;
    std::vector<std::mt19937::result_type> batch_seeds(numBatches);
    for (auto& seed : batch_seeds) {
        seed = m_rng();
    }

    std::vector<MontyHall::RoundResult>& results = tally.results;
    results.assign(2 * numGames, MontyHall::RoundResult());
    tally.stay_batch_means.assign(numBatches, 0.0);
    tally.switch_batch_means.assign(numBatches, 0.0);

    long long stay_wins_p = 0;
    long long switch_wins_p = 0;
    std::atomic<long long> completed_batches{0};
    const long long progress_interval = numBatches > 20 ? numBatches / 20 : 1;
    std::exception_ptr failure = nullptr;

    #pragma omp parallel
    {
        #pragma omp single
        {
            std::cout << "[Monitor] Detected and using " << omp_get_num_threads() << " threads." << std::endl;
        }

        #pragma omp for reduction(+:stay_wins_p, switch_wins_p) schedule(dynamic)
        for (long long b = 0; b < numBatches; ++b) {
            try {
                std::mt19937 local_rng(batch_seeds[b]);
                const long long first = b * batchSize;
                const long long last = std::min(numGames, first + batchSize);
                long long batch_stay_wins = 0;
                long long batch_switch_wins = 0;

                for (long long i = first; i < last; ++i) {
                    MontyHall::RoundReport round = MontyHall::playRound(local_rng);
                    results[2 * i] = round.stay;
                    results[2 * i + 1] = round.switched;
                    if (isWin(round.stay)) batch_stay_wins++;
                    if (isWin(round.switched)) batch_switch_wins++;
                }

                stay_wins_p += batch_stay_wins;
                switch_wins_p += batch_switch_wins;
                tally.stay_batch_means[b] = static_cast<double>(batch_stay_wins) / (last - first);
                tally.switch_batch_means[b] = static_cast<double>(batch_switch_wins) / (last - first);
            } catch (...) {
                // Exceptions must not leave the parallel region; the first one is rethrown below.
                #pragma omp critical
                {
                    if (!failure) failure = std::current_exception();
                }
            }

            long long done = ++completed_batches;
            if (done % progress_interval == 0) {
                #pragma omp critical
                {
                    std::cout << "          ... Progress: " << (100 * done / numBatches) << "% complete." << std::endl;
                }
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    tally.stay_wins = stay_wins_p;
    tally.switch_wins = switch_wins_p;

    std::chrono::duration<double> sim_elapsed = std::chrono::high_resolution_clock::now() - start_sim_time;
    std::cout << "[Monitor] Simulation loop finished in " << sim_elapsed.count() << " seconds." << std::endl;
}

// --- Analysis ---

StrategyRow MonteCarloSimulator::buildRow(MontyHall::Strategy strategy, long long wins, long long numGames,
                                          const std::vector<double>& batch_means, long long k) const {
    StrategyRow row;
    row.strategy = strategy;
    row.wins = wins;
    row.losses = numGames - wins;
    row.win = Statistics::roundTo(static_cast<double>(wins) / numGames, m_precision);
    row.lose = Statistics::roundTo(1.0 - row.win, m_precision);

    if (k < 2) {
        return row;
    }

    // Method of batched means
    double mean_of_means = Statistics::calculateMean(batch_means);
    double variance_of_means = Statistics::calculateVariance(batch_means, mean_of_means);
    double std_error = std::sqrt(variance_of_means / batch_means.size());
    int df = static_cast<int>(batch_means.size()) - 1;

    for (double level : {90.0, 95.0, 99.0}) {
        double t = Statistics::findTValue(level, df);
        row.confidence_intervals.push_back({level,
                                            std::max(0.0, mean_of_means - t * std_error),
                                            std::min(1.0, mean_of_means + t * std_error)});
    }
    return row;
}

BatchResult MonteCarloSimulator::analyzeResults(RunTally& tally, long long numGames, long long k) const {
    std::cout << "\n[Analysis] Computing win proportions for " << numGames << " games..." << std::endl;
    BatchResult result;
    result.num_games = numGames;
    result.precision = m_precision;

    if (k == 1) {
        std::cout << "[Warning] Not enough batches to compute a confidence interval (need at least 2)." << std::endl;
    } else if (k >= 2) {
        std::cout << "[Analysis] Calculating confidence intervals from " << tally.stay_batch_means.size()
                  << " batch means..." << std::endl;
        if (tally.stay_batch_means.size() != static_cast<size_t>(k)) {
            std::cout << "[Warning] Expected " << k << " batches, but collected "
                      << tally.stay_batch_means.size() << " batch means." << std::endl;
        }
    }

    result.proportions.push_back(
        buildRow(MontyHall::Strategy::Stay, tally.stay_wins, numGames, tally.stay_batch_means, k));
    result.proportions.push_back(
        buildRow(MontyHall::Strategy::Switch, tally.switch_wins, numGames, tally.switch_batch_means, k));
    result.results = std::move(tally.results);
    std::cout << "[Analysis] Done." << std::endl;
    return result;
}

void MonteCarloSimulator::printResults(std::ostream& out) const {
    const BatchResult& result = m_batch_result;
    const int width = std::max(8, result.precision + 4);

    out << "\n------ Monty Hall Simulation Results ------" << std::endl;
    out << "Games Played:      " << result.num_games << std::endl;
    out << "-------------------------------------------" << std::endl;
    out << std::left << std::setw(10) << "strategy"
        << std::right << std::setw(width) << "WIN" << std::setw(width) << "LOSE" << std::endl;
    for (const StrategyRow& row : result.proportions) {
        out << std::left << std::setw(10) << MontyHall::toString(row.strategy)
            << std::right << std::fixed << std::setprecision(result.precision)
            << std::setw(width) << row.win << std::setw(width) << row.lose << std::endl;
    }

    bool has_intervals = false;
    for (const StrategyRow& row : result.proportions) {
        if (!row.confidence_intervals.empty()) has_intervals = true;
    }
    if (has_intervals) {
        out << "\n------ Confidence Intervals for the Win Proportion ------" << std::endl;
        out << "        (Method: Batched Means)" << std::endl;
        for (const StrategyRow& row : result.proportions) {
            for (const ConfidenceInterval& ci : row.confidence_intervals) {
                out << std::left << std::setw(8) << MontyHall::toString(row.strategy) << std::right
                    << std::fixed << std::setprecision(1) << ci.level << "% Confidence Interval: "
                    << std::setprecision(6) << "[" << ci.lower_bound << ", " << ci.upper_bound << "]" << std::endl;
            }
        }
    }
    out << "-------------------------------------------" << std::endl;
}
