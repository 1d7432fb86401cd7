#include "monte_carlo.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <numeric>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace powerfin {

// ============================================================================
// Distribution Implementation
// ============================================================================

std::string distribution_to_string(DistributionType type) {
    switch (type) {
        case DistributionType::Uniform: return "uniform";
        case DistributionType::Triangular: return "triangular";
        case DistributionType::TruncatedNormal: return "truncated_normal";
    }
    return "unknown";
}

DistributionType string_to_distribution(const std::string& str) {
    if (str == "uniform") return DistributionType::Uniform;
    if (str == "triangular") return DistributionType::Triangular;
    if (str == "truncated_normal" || str == "normal") return DistributionType::TruncatedNormal;
    throw std::invalid_argument("Unknown distribution type: " + str);
}

Distribution::Distribution(DistributionType type, double min, double max,
                           double mode, double mean, double sd)
    : type_(type), min_(min), max_(max), mode_(mode), mean_(mean), sd_(sd) {
    if (!std::isfinite(min) || !std::isfinite(max) || min > max) {
        throw ValidationError("distribution bounds must be finite with min <= max");
    }
    if (type == DistributionType::Triangular && (mode < min || mode > max)) {
        throw ValidationError("triangular mode must lie within [min, max]");
    }
    if (type == DistributionType::TruncatedNormal && !(sd > 0.0 && std::isfinite(mean))) {
        throw ValidationError("truncated normal needs a finite mean and positive sd");
    }
}

Distribution Distribution::uniform(double min, double max) {
    return Distribution(DistributionType::Uniform, min, max, 0.5 * (min + max), 0.5 * (min + max), 0.0);
}

Distribution Distribution::triangular(double min, double mode, double max) {
    return Distribution(DistributionType::Triangular, min, max, mode, (min + mode + max) / 3.0, 0.0);
}

Distribution Distribution::truncated_normal(double mean, double sd, double min, double max) {
    return Distribution(DistributionType::TruncatedNormal, min, max, mean, mean, sd);
}

double Distribution::sample(std::mt19937_64& rng) const {
    if (min_ == max_) {
        return min_;
    }

    switch (type_) {
        case DistributionType::Uniform: {
            std::uniform_real_distribution<double> uniform(min_, max_);
            return uniform(rng);
        }
        case DistributionType::Triangular: {
            // Inverse CDF
            std::uniform_real_distribution<double> unit(0.0, 1.0);
            double u = unit(rng);
            double width = max_ - min_;
            double split = (mode_ - min_) / width;
            if (u < split) {
                return min_ + std::sqrt(u * width * (mode_ - min_));
            }
            return max_ - std::sqrt((1.0 - u) * width * (max_ - mode_));
        }
        case DistributionType::TruncatedNormal: {
            std::normal_distribution<double> normal(mean_, sd_);
            for (int attempt = 0; attempt < 10000; ++attempt) {
                double x = normal(rng);
                if (x >= min_ && x <= max_) {
                    return x;
                }
            }
            // Bounds far in the tail
            return std::clamp(mean_, min_, max_);
        }
    }
    return min_;
}

// ============================================================================
// Result Structures
// ============================================================================

MonteCarloConfig::MonteCarloConfig()
    : iterations(1000),
      seed(42),
      capacity_factor(Distribution::uniform(0.38, 0.42)),
      opex_usd_per_mwh(Distribution::triangular(6.50, 6.83, 7.50)),
      fx_depreciation(Distribution::uniform(0.03, 0.05)),
      hard_currency_rate(Distribution::uniform(0.065, 0.09)),
      local_currency_rate(Distribution::uniform(0.075, 0.09)),
      debt_ratio(Distribution::uniform(0.50, 0.80)),
      hard_currency_share(0.45),
      dfi_share(0.10),
      dscr_covenant(1.20) {}

MonteCarloRow::MonteCarloRow()
    : iteration(0),
      capacity_factor(0.0),
      opex_usd_per_mwh(0.0),
      fx_depreciation(0.0),
      hard_currency_rate(0.0),
      local_currency_rate(0.0),
      debt_ratio(0.0),
      equity_irr(0.0),
      equity_irr_converged(false),
      project_irr(0.0),
      npv(0.0) {}

MetricSummary::MetricSummary()
    : mean(0.0), std_dev(0.0), p10(0.0), p50(0.0), p90(0.0),
      min(0.0), max(0.0), count(0) {}

MonteCarloSummary::MonteCarloSummary()
    : prob_dscr_below_covenant(0.0),
      dscr_covenant(0.0),
      irr_not_converged(0) {}

MonteCarloResult::MonteCarloResult()
    : seed(0), execution_time_ms(0.0) {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

// Calculate mean of a vector
double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

// Calculate standard deviation (population std dev)
double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

// Percentile by linear interpolation; values sorted ascending, p in [0, 100]
double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

struct TrialDraw {
    double capacity_factor;
    double opex_usd_per_mwh;
    double fx_depreciation;
    double hard_currency_rate;
    double local_currency_rate;
    double debt_ratio;
};

MonteCarloRow evaluate_trial(size_t iteration,
                             const TrialDraw& draw,
                             const ProjectParameters& base_params,
                             const DebtTerms& debt_terms,
                             const MonteCarloConfig& config) {
    ProjectInputs inputs = base_params.inputs();
    inputs.capacity_factor = draw.capacity_factor;
    inputs.opex_usd_per_mwh = draw.opex_usd_per_mwh;
    inputs.fx_depreciation = draw.fx_depreciation;
    ProjectParameters params(inputs);

    DebtTerms terms = debt_terms;
    terms.hard_currency_rate = draw.hard_currency_rate;
    terms.local_currency_rate = draw.local_currency_rate;
    DebtStructure debt = DebtStructure::from_ratios(
        params.total_capex(), draw.debt_ratio,
        config.hard_currency_share, config.dfi_share, terms);

    FinancialResults model = build_model(params, debt);

    MonteCarloRow row;
    row.iteration = iteration;
    row.capacity_factor = draw.capacity_factor;
    row.opex_usd_per_mwh = draw.opex_usd_per_mwh;
    row.fx_depreciation = draw.fx_depreciation;
    row.hard_currency_rate = draw.hard_currency_rate;
    row.local_currency_rate = draw.local_currency_rate;
    row.debt_ratio = draw.debt_ratio;
    row.equity_irr = model.equity_irr();
    row.equity_irr_converged = model.equity_irr_result.converged;
    row.project_irr = model.project_irr();
    row.npv = model.npv;
    row.min_dscr = model.min_dscr;
    return row;
}

MonteCarloSummary summarize_rows(const std::vector<MonteCarloRow>& rows, double covenant) {
    MonteCarloSummary summary;
    summary.dscr_covenant = covenant;

    std::vector<double> equity_irrs;
    std::vector<double> project_irrs;
    std::vector<double> npvs;
    std::vector<double> dscrs;
    size_t breaches = 0;

    for (const auto& row : rows) {
        if (row.equity_irr_converged) {
            equity_irrs.push_back(row.equity_irr);
        } else {
            summary.irr_not_converged++;
        }
        if (std::isfinite(row.project_irr)) {
            project_irrs.push_back(row.project_irr);
        }
        npvs.push_back(row.npv);
        if (row.min_dscr) {
            dscrs.push_back(*row.min_dscr);
            if (*row.min_dscr < covenant) {
                breaches++;
            }
        }
    }

    summary.equity_irr = summarize(equity_irrs);
    summary.project_irr = summarize(project_irrs);
    summary.npv = summarize(npvs);
    summary.min_dscr = summarize(dscrs);
    if (!rows.empty()) {
        summary.prob_dscr_below_covenant = static_cast<double>(breaches) / static_cast<double>(rows.size());
    }
    return summary;
}

} // anonymous namespace

MetricSummary summarize(std::vector<double> values) {
    MetricSummary summary;
    if (values.empty()) {
        return summary;
    }

    std::sort(values.begin(), values.end());
    summary.count = values.size();
    summary.mean = calculate_mean(values);
    summary.std_dev = calculate_std_dev(values, summary.mean);
    summary.p10 = calculate_percentile(values, 10.0);
    summary.p50 = calculate_percentile(values, 50.0);
    summary.p90 = calculate_percentile(values, 90.0);
    summary.min = values.front();
    summary.max = values.back();
    return summary;
}

// ============================================================================
// Monte Carlo Implementation
// ============================================================================

MonteCarloResult run_monte_carlo(const ProjectParameters& base_params,
                                 const DebtTerms& debt_terms,
                                 const MonteCarloConfig& config) {
    MonteCarloResult result;
    result.seed = config.seed;

    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    logger.log_analysis_start("monte_carlo", {
        {"iterations", std::to_string(config.iterations)},
        {"seed", std::to_string(config.seed)}
    });

    // Draws are sequential so the table depends only on the seed
    std::mt19937_64 rng(config.seed);
    std::vector<TrialDraw> draws(config.iterations);
    for (auto& draw : draws) {
        draw.capacity_factor = config.capacity_factor.sample(rng);
        draw.opex_usd_per_mwh = config.opex_usd_per_mwh.sample(rng);
        draw.fx_depreciation = config.fx_depreciation.sample(rng);
        draw.hard_currency_rate = config.hard_currency_rate.sample(rng);
        draw.local_currency_rate = config.local_currency_rate.sample(rng);
        draw.debt_ratio = config.debt_ratio.sample(rng);
    }

    result.rows.resize(draws.size());
    std::exception_ptr failure;

#ifdef HAVE_OPENMP
    const long long count = static_cast<long long>(draws.size());
    #pragma omp parallel for schedule(dynamic, 16)
    for (long long i = 0; i < count; ++i) {
        try {
            size_t idx = static_cast<size_t>(i);
            result.rows[idx] = evaluate_trial(idx, draws[idx], base_params, debt_terms, config);
        } catch (...) {
            // Rethrown after the parallel region
            #pragma omp critical
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }
#else
    for (size_t i = 0; i < draws.size(); ++i) {
        try {
            result.rows[i] = evaluate_trial(i, draws[i], base_params, debt_terms, config);
        } catch (...) {
            failure = std::current_exception();
            break;
        }
    }
#endif

    if (failure) {
        std::rethrow_exception(failure);
    }

    result.summary = summarize_rows(result.rows, config.dscr_covenant);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    logger.log_analysis_complete("monte_carlo", result.execution_time_ms, {
        {"iterations", std::to_string(result.rows.size())},
        {"mean_equity_irr", format_value(result.summary.equity_irr.mean)},
        {"p50_npv", format_value(result.summary.npv.p50)},
        {"prob_dscr_below_covenant", format_value(result.summary.prob_dscr_below_covenant)},
        {"irr_not_converged", std::to_string(result.summary.irr_not_converged)}
    });
    return result;
}

MonteCarloResult run_monte_carlo(size_t n, uint64_t seed) {
    MonteCarloConfig config;
    config.iterations = n;
    config.seed = seed;
    return run_monte_carlo(ProjectParameters(), DebtTerms(), config);
}

} // namespace powerfin
