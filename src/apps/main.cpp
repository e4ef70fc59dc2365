#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h>

#include <pdmp/domains/polytope.hpp>
#include <pdmp/engine/multiChain.hpp>
#include <pdmp/path/pathAnalytics.hpp>
#include <pdmp/rng/rng_factory.hpp>
#include <pdmp/targets/logisticRegression.hpp>
#include <pdmp/utils/dataLoader.hpp>

using namespace pdmp;

constexpr std::size_t dim = 4;

// --- RUN SETTINGS ---
constexpr std::size_t n_chains             = 4;
constexpr std::size_t n_synthetic_rows     = 2000;
constexpr std::size_t max_gradient_evals   = 20000;
constexpr double      refresh_rate         = 1.0;
constexpr double      prior_scale          = 5.0;


// --- FUNCTION PROTOTYPES ---
void makeSyntheticData(const std::array<double, dim>& beta_true,
                       std::size_t n_rows,
                       std::uint32_t seed,
                       std::vector<geom::Point<dim>>& features,
                       std::vector<int>& labels);

void printChainTable(const std::vector<Path<dim>>& paths);

void printVector(const std::string& label, const geom::Point<dim>& p);


// --- MAIN ---

int main(int argc, char* argv[]) {
    // Usage: ./pdmp_logreg [seed|-] [num_threads] [observations_file]
    std::uint32_t seed = rng::kDefaultSeed;
    int num_threads = omp_get_max_threads();
    std::string data_file;

    if (argc > 1) {
        std::string seed_arg = argv[1];
        if (seed_arg != "-") {
            try {
                seed = static_cast<std::uint32_t>(std::stoul(seed_arg));
            } catch (const std::exception&) {
                std::cerr << "Invalid seed '" << seed_arg << "', using " << seed << "\n";
            }
        }
    }
    if (argc > 2) {
        try {
            const int requested = std::stoi(argv[2]);
            num_threads = (requested <= 0) ? 1 : requested;
        } catch (const std::exception&) {
            std::cerr << "Invalid thread count '" << argv[2] << "', using " << num_threads << "\n";
        }
    }
    if (argc > 3) {
        data_file = argv[3];
    }
    omp_set_num_threads(num_threads);

    std::cout << "===========================================" << std::endl;
    std::cout << "   Constrained Bouncy Particle Sampler" << std::endl;
    std::cout << "   Logistic regression, beta >= 0" << std::endl;
    std::cout << "===========================================" << std::endl;
    std::cout << "Seed: " << seed << " | Threads: " << num_threads << " | Chains: " << n_chains << "\n";
    std::cout << "(Usage: ./pdmp_logreg [seed|-] [num_threads] [observations_file])\n\n";

    std::vector<geom::Point<dim>> features;
    std::vector<int> labels;

    // One coefficient is zero so the non-negativity constraint is active.
    const std::array<double, dim> beta_true = {1.0, 0.0, 0.5, 2.0};

    try {
        if (!data_file.empty()) {
            std::cout << "Reading observations from " << data_file << "..." << std::endl;
            utils::readObservations<dim>(data_file, features, labels);
        } else {
            std::cout << "Generating " << n_synthetic_rows << " synthetic observations..." << std::endl;
            makeSyntheticData(beta_true, n_synthetic_rows, seed, features, labels);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        targets::LogisticRegression<dim> posterior(features, labels, prior_scale);
        const auto orthant = domains::Polytope<dim>::nonNegativeOrthant();

        std::cout << "Observations: " << posterior.numObservations()
                  << " | Lipschitz bound: " << posterior.lipschitz() << "\n\n";

        // Chains start at different interior points with different directions.
        std::vector<engine::SimulationConfig<dim>> configs(n_chains);
        auto init_rng = rng::make_engine_with_seed(std::optional<std::uint32_t>{seed}, 1000u);
        std::uniform_real_distribution<double> start_dist(0.1, 2.0);
        std::normal_distribution<double> dir_dist(0.0, 1.0);
        for (auto& cfg : configs) {
            for (std::size_t k = 0; k < dim; ++k) {
                cfg.x0[k] = start_dist(init_rng);
                cfg.v0[k] = dir_dist(init_rng);
            }
            cfg.v0 *= 1.0 / geom::norm(cfg.v0);
            cfg.max_gradient_evaluations = max_gradient_evals;
            cfg.refresh_rate = refresh_rate;
        }

        const std::vector<Path<dim>> paths = engine::runChains(orthant, posterior, configs, seed);

        printChainTable(paths);

        std::cout << "\nCombined diagnostics:\n" << engine::combinedDiagnostics(paths) << "\n";

        geom::Point<dim> truth(beta_true);
        printVector("True beta", truth);
        printVector("Posterior mean", analytics::pooledMean(paths));

        std::array<double, dim> ess_total{};
        for (const auto& p : paths) {
            const auto ess = analytics::effectiveSampleSize(p);
            for (std::size_t k = 0; k < dim; ++k)
                ess_total[k] += ess[k];
        }
        std::cout << std::setw(16) << std::left << "ESS (summed)" << std::right << " : ";
        for (double e : ess_total)
            std::cout << std::setw(12) << std::fixed << std::setprecision(1) << e;
        std::cout << "\n";

    } catch (const oracles::IntensityBoundViolation& e) {
        std::cerr << "Bound violation: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nDone." << std::endl;
    return 0;
}

// --- FUNCTION IMPLEMENTATIONS ---

void makeSyntheticData(const std::array<double, dim>& beta_true,
                       std::size_t n_rows,
                       std::uint32_t seed,
                       std::vector<geom::Point<dim>>& features,
                       std::vector<int>& labels)
{
    auto gen = rng::make_engine_with_seed(std::optional<std::uint32_t>{seed}, 999u);
    std::normal_distribution<double> feature_dist(0.0, 1.0);
    std::uniform_real_distribution<double> uni(0.0, 1.0);

    const geom::Point<dim> beta(beta_true);

    features.clear();
    labels.clear();
    features.reserve(n_rows);
    labels.reserve(n_rows);

    for (std::size_t i = 0; i < n_rows; ++i) {
        geom::Point<dim> a;
        for (std::size_t k = 0; k < dim; ++k)
            a[k] = feature_dist(gen);

        const double p = 1.0 / (1.0 + std::exp(-geom::dot(a, beta)));
        features.push_back(a);
        labels.push_back(uni(gen) < p ? 1 : 0);
    }
}

void printChainTable(const std::vector<Path<dim>>& paths)
{
    std::cout << std::string(96, '-') << '\n';
    std::cout << std::setw(6)  << "Chain" << " | "
              << std::setw(10) << "Boundary" << " | "
              << std::setw(10) << "Bounces" << " | "
              << std::setw(10) << "Refresh" << " | "
              << std::setw(10) << "GradEvals" << " | "
              << std::setw(12) << "SimTime" << " | "
              << std::setw(10) << "Wall [s]" << '\n';
    std::cout << std::string(96, '-') << '\n';

    for (std::size_t c = 0; c < paths.size(); ++c) {
        const Diagnostics& d = paths[c].diagnostics();
        std::cout << std::setw(6)  << c << " | "
                  << std::setw(10) << d.boundary_hits << " | "
                  << std::setw(10) << d.bounces << " | "
                  << std::setw(10) << d.refreshments << " | "
                  << std::setw(10) << d.gradient_evaluations << " | "
                  << std::setw(12) << std::fixed << std::setprecision(3) << d.simulated_time << " | "
                  << std::setw(10) << std::setprecision(4) << d.wall_clock_seconds << '\n';
    }
    std::cout << std::string(96, '-') << '\n';
}

void printVector(const std::string& label, const geom::Point<dim>& p)
{
    std::cout << std::setw(16) << std::left << label << std::right << " : ";
    for (std::size_t k = 0; k < dim; ++k)
        std::cout << std::setw(12) << std::fixed << std::setprecision(4) << p[k];
    std::cout << "\n";
}
