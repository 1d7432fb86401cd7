#include "returns.hpp"
#include "logger.hpp"
#include "root_finding.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <stdexcept>

namespace powerfin {

// ============================================================================
// IrrResult Implementation
// ============================================================================

IrrResult::IrrResult()
    : rate(std::numeric_limits<double>::quiet_NaN()),
      converged(false),
      iterations(0),
      npv_at_rate(std::numeric_limits<double>::quiet_NaN()),
      sign_changes(0) {}

// ============================================================================
// NPV
// ============================================================================

double npv(const std::vector<double>& cashflows, double rate) {
    if (cashflows.empty()) {
        throw std::invalid_argument("Cash-flow series is empty");
    }
    if (!(rate > -1.0)) {
        throw std::invalid_argument("Discount rate must be greater than -1");
    }

    double total = 0.0;
    if (rate == 0.0) {
        for (double cf : cashflows) {
            total += cf;
        }
        return total;
    }

    const double base = 1.0 + rate;
    for (size_t t = 0; t < cashflows.size(); ++t) {
        total += cashflows[t] / std::pow(base, static_cast<double>(t));
    }
    return total;
}

double xnpv(const std::vector<double>& cashflows,
            const std::vector<double>& times,
            double rate) {
    if (cashflows.empty()) {
        throw std::invalid_argument("Cash-flow series is empty");
    }
    if (cashflows.size() != times.size()) {
        throw std::invalid_argument("Cash flows and times must have the same length");
    }
    if (!(rate > -1.0)) {
        throw std::invalid_argument("Discount rate must be greater than -1");
    }

    double total = 0.0;
    for (size_t i = 0; i < cashflows.size(); ++i) {
        total += cashflows[i] / std::pow(1.0 + rate, times[i] - times[0]);
    }
    return total;
}

int count_sign_changes(const std::vector<double>& cashflows) {
    int changes = 0;
    double previous = 0.0;
    for (double cf : cashflows) {
        if (cf == 0.0) continue;
        if (previous != 0.0 && (cf > 0.0) != (previous > 0.0)) {
            ++changes;
        }
        previous = cf;
    }
    return changes;
}

double npv_tolerance(const std::vector<double>& cashflows) {
    double scale = 1.0;
    for (double cf : cashflows) {
        scale = std::max(scale, std::abs(cf));
    }
    return 1e-8 * scale;
}

namespace {

// d NPV / d rate
double npv_derivative(const std::vector<double>& cashflows, double rate) {
    const double base = 1.0 + rate;
    double total = 0.0;
    for (size_t t = 1; t < cashflows.size(); ++t) {
        double td = static_cast<double>(t);
        total -= td * cashflows[t] / std::pow(base, td + 1.0);
    }
    return total;
}

void validate_series(const std::vector<double>& cashflows) {
    if (cashflows.empty()) {
        throw std::invalid_argument("Cash-flow series is empty");
    }
    bool all_zero = std::all_of(cashflows.begin(), cashflows.end(),
                                [](double cf) { return cf == 0.0; });
    if (all_zero) {
        throw std::invalid_argument("Cash-flow series is all zero");
    }
    for (double cf : cashflows) {
        if (!std::isfinite(cf)) {
            throw std::invalid_argument("Cash-flow series contains a non-finite value");
        }
    }
}

// Newton refinement of a polynomial root; stays inside (-1, inf)
double polish_rate(const std::vector<double>& cashflows, double rate, int& iterations) {
    for (int i = 0; i < 50; ++i) {
        double f = npv(cashflows, rate);
        double df = npv_derivative(cashflows, rate);
        if (df == 0.0 || !std::isfinite(f) || !std::isfinite(df)) {
            break;
        }
        double step = f / df;
        double next = rate - step;
        while (next <= -1.0) {
            step *= 0.5;
            next = rate - step;
        }
        ++iterations;
        rate = next;
        if (std::abs(step) < 1e-15 * std::max(1.0, std::abs(rate))) {
            break;
        }
    }
    return rate;
}

} // anonymous namespace

// ============================================================================
// BracketedBrentStrategy Implementation
// ============================================================================

BracketedBrentStrategy::BracketedBrentStrategy(double lower, double upper,
                                               double xtol, int max_iter)
    : lower_(lower), upper_(upper), xtol_(xtol), max_iter_(max_iter) {
    if (!(lower > -1.0) || !(upper > lower)) {
        throw std::invalid_argument("Brent domain must satisfy -1 < lower < upper");
    }
    if (xtol <= 0.0 || max_iter <= 0) {
        throw std::invalid_argument("Brent tolerance and iteration cap must be positive");
    }
}

IrrResult BracketedBrentStrategy::solve(const std::vector<double>& cashflows) const {
    RootFindingConfig config;
    config.max_iter = static_cast<size_t>(max_iter_);
    config.tol_abs = xtol_;

    RootFindingResult root = brent_find_root(
        [&cashflows](double r) { return npv(cashflows, r); },
        lower_, upper_, config);

    IrrResult result;
    result.method = name();
    result.iterations = static_cast<int>(root.iterations);
    result.rate = root.root;
    result.npv_at_rate = npv(cashflows, root.root);
    result.converged = root.converged;
    if (!root.converged) {
        result.message = root.failure_reason;
    }
    return result;
}

// ============================================================================
// PolynomialRootStrategy Implementation
// ============================================================================

IrrResult PolynomialRootStrategy::solve(const std::vector<double>& cashflows) const {
    IrrResult result;
    result.method = name();

    size_t first = 0;
    while (first < cashflows.size() && cashflows[first] == 0.0) ++first;
    size_t last = cashflows.size();
    while (last > first && cashflows[last - 1] == 0.0) --last;

    if (last - first < 2) {
        result.message = "Fewer than two non-zero cash flows";
        return result;
    }

    // Leading zero flows only contribute roots at x = 0 (infinite rate)
    const Eigen::Index degree = static_cast<Eigen::Index>(last - first - 1);
    const double lead = cashflows[last - 1];
    Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(degree, degree);
    for (Eigen::Index i = 1; i < degree; ++i) {
        companion(i, i - 1) = 1.0;
    }
    for (Eigen::Index i = 0; i < degree; ++i) {
        companion(i, degree - 1) = -cashflows[first + static_cast<size_t>(i)] / lead;
    }

    Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
    if (solver.info() != Eigen::Success) {
        result.message = "Eigenvalue decomposition failed";
        return result;
    }

    const double tolerance = npv_tolerance(cashflows);
    std::vector<double> roots;
    double best_residual = std::numeric_limits<double>::infinity();
    int iterations = 0;

    for (Eigen::Index i = 0; i < solver.eigenvalues().size(); ++i) {
        std::complex<double> x = solver.eigenvalues()[i];
        if (std::abs(x.imag()) > 1e-7 * std::max(1.0, std::abs(x.real())) || x.real() <= 0.0) {
            continue;
        }
        double rate = polish_rate(cashflows, 1.0 / x.real() - 1.0, iterations);
        double residual = std::abs(npv(cashflows, rate));
        if (residual <= tolerance) {
            roots.push_back(rate);
        } else if (residual < best_residual) {
            best_residual = residual;
            result.rate = rate;
            result.npv_at_rate = npv(cashflows, rate);
        }
    }
    result.iterations = iterations;

    if (roots.empty()) {
        result.message = "No real root within tolerance";
        return result;
    }

    double chosen = std::numeric_limits<double>::quiet_NaN();
    for (double r : roots) {
        if (r > 0.0 && (std::isnan(chosen) || r < chosen)) chosen = r;
    }
    if (std::isnan(chosen)) {
        chosen = *std::min_element(roots.begin(), roots.end(),
                                   [](double a, double b) { return std::abs(a) < std::abs(b); });
    }

    result.rate = chosen;
    result.npv_at_rate = npv(cashflows, chosen);
    result.converged = true;
    if (roots.size() > 1) {
        result.message = std::to_string(roots.size()) + " real roots found";
    }
    return result;
}

// ============================================================================
// IrrSolver Implementation
// ============================================================================

IrrSolver::IrrSolver() {
    strategies_.push_back(std::make_unique<BracketedBrentStrategy>());
    strategies_.push_back(std::make_unique<PolynomialRootStrategy>());
}

IrrSolver::IrrSolver(std::vector<std::unique_ptr<IrrStrategy>> strategies)
    : strategies_(std::move(strategies)) {
    if (strategies_.empty()) {
        throw std::invalid_argument("IrrSolver needs at least one strategy");
    }
}

IrrResult IrrSolver::solve(const std::vector<double>& cashflows) const {
    validate_series(cashflows);

    const int sign_changes = count_sign_changes(cashflows);
    if (sign_changes > 1) {
        Logger::get_instance().log_multiple_sign_changes(sign_changes, cashflows.size());
    }

    IrrResult best;
    for (const auto& strategy : strategies_) {
        IrrResult attempt = strategy->solve(cashflows);
        attempt.sign_changes = sign_changes;
        if (attempt.converged) {
            return attempt;
        }
        if (std::isfinite(attempt.npv_at_rate) &&
            (!std::isfinite(best.npv_at_rate) || std::abs(attempt.npv_at_rate) < std::abs(best.npv_at_rate))) {
            best = attempt;
        }
    }

    // Coarse scan so the best candidate is never empty
    for (int i = 0; i <= 599; ++i) {
        double rate = -0.99 + 0.01 * i;
        double value = npv(cashflows, rate);
        if (!std::isfinite(best.npv_at_rate) || std::abs(value) < std::abs(best.npv_at_rate)) {
            best.rate = rate;
            best.npv_at_rate = value;
            best.method = "grid_scan";
        }
    }

    best.converged = false;
    best.sign_changes = sign_changes;
    best.message = "All IRR strategies failed to converge";
    Logger::get_instance().log_irr_not_converged(best, cashflows.size());
    return best;
}

IrrResult irr(const std::vector<double>& cashflows) {
    static const IrrSolver solver;
    return solver.solve(cashflows);
}

IrrResult xirr(const std::vector<double>& cashflows, const std::vector<double>& times) {
    validate_series(cashflows);
    if (cashflows.size() != times.size()) {
        throw std::invalid_argument("Cash flows and times must have the same length");
    }
    for (size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i]) || (i > 0 && times[i] < times[i - 1])) {
            throw std::invalid_argument("Times must be finite and non-decreasing");
        }
    }

    auto value_at = [&](double r) { return xnpv(cashflows, times, r); };

    RootFindingConfig config;
    RootFindingResult root = brent_find_root(value_at, -0.99, 5.00, config);

    IrrResult result;
    result.method = "brent_irregular";
    result.sign_changes = count_sign_changes(cashflows);
    result.iterations = static_cast<int>(root.iterations);
    result.rate = root.root;
    result.npv_at_rate = value_at(root.root);
    result.converged = root.converged;
    if (root.converged) {
        return result;
    }

    // Scan 1 + r geometrically over [0.01, 1000] and refine the first bracket
    constexpr int SCAN_POINTS = 500;
    double previous_rate = -0.99;
    double previous_value = value_at(previous_rate);
    result.method = "grid_scan";
    result.rate = previous_rate;
    result.npv_at_rate = previous_value;
    for (int i = 1; i <= SCAN_POINTS; ++i) {
        double rate = 0.01 * std::pow(10.0, 5.0 * i / SCAN_POINTS) - 1.0;
        double value = value_at(rate);
        if (!std::isfinite(value)) {
            continue;
        }
        if (std::abs(value) < std::abs(result.npv_at_rate) || !std::isfinite(result.npv_at_rate)) {
            result.rate = rate;
            result.npv_at_rate = value;
        }
        if (std::isfinite(previous_value) && (previous_value < 0.0) != (value < 0.0)) {
            RootFindingResult refined = brent_find_root(value_at, previous_rate, rate, config);
            result.iterations += static_cast<int>(refined.iterations);
            if (refined.converged) {
                result.rate = refined.root;
                result.npv_at_rate = value_at(refined.root);
                result.converged = true;
                result.message.clear();
                return result;
            }
        }
        previous_rate = rate;
        previous_value = value;
    }

    result.message = "No sign change of NPV between -99% and 99900%";
    Logger::get_instance().log_irr_not_converged(result, cashflows.size());
    return result;
}

} // namespace powerfin
