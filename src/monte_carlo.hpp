#ifndef POWERFIN_MONTE_CARLO_HPP
#define POWERFIN_MONTE_CARLO_HPP

#include "financial_model.hpp"
#include "parameters.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace powerfin {

enum class DistributionType {
    Uniform,            // [min, max]
    Triangular,         // min, mode, max
    TruncatedNormal     // mean, sd, cut to [min, max]
};

std::string distribution_to_string(DistributionType type);
DistributionType string_to_distribution(const std::string& str);

// Distribution of one uncertain input
class Distribution {
public:
    static Distribution uniform(double min, double max);
    static Distribution triangular(double min, double mode, double max);
    static Distribution truncated_normal(double mean, double sd, double min, double max);

    double sample(std::mt19937_64& rng) const;

    DistributionType type() const { return type_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double mode() const { return mode_; }
    double mean() const { return mean_; }
    double sd() const { return sd_; }

private:
    Distribution(DistributionType type, double min, double max,
                 double mode, double mean, double sd);

    DistributionType type_;
    double min_;
    double max_;
    double mode_;
    double mean_;
    double sd_;
};

// Uncertain inputs, drawn per trial in declaration order
struct MonteCarloConfig {
    size_t iterations;
    uint64_t seed;
    Distribution capacity_factor;
    Distribution opex_usd_per_mwh;
    Distribution fx_depreciation;
    Distribution hard_currency_rate;
    Distribution local_currency_rate;
    Distribution debt_ratio;
    double hard_currency_share;     // Held fixed across trials
    double dfi_share;               // Held fixed across trials
    double dscr_covenant;           // Threshold for the breach probability

    MonteCarloConfig();
};

// Sampled inputs and resulting metrics for one trial
struct MonteCarloRow {
    size_t iteration;
    double capacity_factor;
    double opex_usd_per_mwh;
    double fx_depreciation;
    double hard_currency_rate;
    double local_currency_rate;
    double debt_ratio;
    double equity_irr;
    bool equity_irr_converged;
    double project_irr;
    double npv;
    std::optional<double> min_dscr;

    MonteCarloRow();
};

// Distribution statistics of one output metric
struct MetricSummary {
    double mean;
    double std_dev;
    double p10;
    double p50;
    double p90;
    double min;
    double max;
    size_t count;           // Values that entered the statistics

    MetricSummary();
};

struct MonteCarloSummary {
    MetricSummary equity_irr;       // Converged IRRs only
    MetricSummary project_irr;
    MetricSummary npv;
    MetricSummary min_dscr;         // Trials with a defined DSCR only
    double prob_dscr_below_covenant;
    double dscr_covenant;
    size_t irr_not_converged;

    MonteCarloSummary();
};

struct MonteCarloResult {
    std::vector<MonteCarloRow> rows;
    MonteCarloSummary summary;
    uint64_t seed;
    double execution_time_ms;

    MonteCarloResult();
};

// Run `config.iterations` independent trials around the base inputs.
//
// All draws come from one std::mt19937_64 seeded with config.seed, trial
// by trial, so a given seed always reproduces the same table. Trials are
// evaluated in parallel when built with OpenMP.
MonteCarloResult run_monte_carlo(const ProjectParameters& base_params,
                                 const DebtTerms& debt_terms,
                                 const MonteCarloConfig& config = MonteCarloConfig());

// Reference case with default distributions
MonteCarloResult run_monte_carlo(size_t n, uint64_t seed);

// Statistics over a set of values (population std dev, interpolated percentiles)
MetricSummary summarize(std::vector<double> values);

} // namespace powerfin

#endif // POWERFIN_MONTE_CARLO_HPP
