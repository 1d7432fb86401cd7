#ifndef POWERFIN_RETURNS_HPP
#define POWERFIN_RETURNS_HPP

#include <memory>
#include <string>
#include <vector>

namespace powerfin {

// Outcome of an IRR solve. When converged is false, rate holds the best
// candidate found (smallest |NPV|) and may be NaN if nothing was found.
struct IrrResult {
    double rate;
    bool converged;
    std::string method;         // Strategy that produced the rate
    int iterations;
    double npv_at_rate;
    int sign_changes;           // Sign changes in the cash-flow series
    std::string message;

    IrrResult();
};

// Net present value with t = 0 undiscounted. Exactly the raw sum at rate 0.
// Throws std::invalid_argument for an empty series or rate <= -1.
double npv(const std::vector<double>& cashflows, double rate);

// Net present value with irregular timing, times in years from the first flow
double xnpv(const std::vector<double>& cashflows,
            const std::vector<double>& times,
            double rate);

int count_sign_changes(const std::vector<double>& cashflows);

// |NPV| at which a candidate rate is accepted as a root
double npv_tolerance(const std::vector<double>& cashflows);

// One method in the IRR fallback chain
class IrrStrategy {
public:
    virtual ~IrrStrategy() = default;
    virtual std::string name() const = 0;
    virtual IrrResult solve(const std::vector<double>& cashflows) const = 0;
};

// Brent's method over a fixed rate domain. Fails (converged = false) when
// NPV has the same sign at both ends of the domain.
class BracketedBrentStrategy : public IrrStrategy {
public:
    BracketedBrentStrategy(double lower = -0.50, double upper = 5.00,
                           double xtol = 1e-12, int max_iter = 200);

    std::string name() const override { return "brent"; }
    IrrResult solve(const std::vector<double>& cashflows) const override;

private:
    double lower_;
    double upper_;
    double xtol_;
    int max_iter_;
};

// Real roots of sum_t cf_t * x^t with x = 1 / (1 + r), found as the
// eigenvalues of the companion matrix and polished with Newton steps.
// The smallest positive rate is canonical; if no root is positive, the
// root closest to zero is returned.
class PolynomialRootStrategy : public IrrStrategy {
public:
    std::string name() const override { return "polynomial"; }
    IrrResult solve(const std::vector<double>& cashflows) const override;
};

// Ordered strategy chain; the first converged result wins
class IrrSolver {
public:
    // Brent over [-0.50, 5.00], then polynomial roots
    IrrSolver();
    explicit IrrSolver(std::vector<std::unique_ptr<IrrStrategy>> strategies);

    // Throws std::invalid_argument for an empty or all-zero series.
    // Non-convergence is reported through the result, never thrown.
    IrrResult solve(const std::vector<double>& cashflows) const;

    size_t strategy_count() const { return strategies_.size(); }

private:
    std::vector<std::unique_ptr<IrrStrategy>> strategies_;
};

// IRR with the default strategy chain
IrrResult irr(const std::vector<double>& cashflows);

// IRR for irregularly timed flows, times in years. Brent over [-0.99, 5.00],
// then a geometric scan of rates up to 99900% refined by Brent. The
// polynomial strategy does not apply to non-integer exponents.
IrrResult xirr(const std::vector<double>& cashflows, const std::vector<double>& times);

} // namespace powerfin

#endif // POWERFIN_RETURNS_HPP
