#ifndef POWERFIN_SQP_SOLVER_HPP
#define POWERFIN_SQP_SOLVER_HPP

#include <functional>
#include <string>
#include <vector>

namespace powerfin {

// Objective (minimized) and inequality constraints c_i(x) >= 0 at a point
struct SqpEvaluation {
    double objective;
    std::vector<double> constraints;
};

// Bounded problem with inequality constraints. The QP subproblem
// enumerates active sets, so it is meant for a handful of variables.
struct SqpProblem {
    std::vector<double> lower;
    std::vector<double> upper;
    std::function<SqpEvaluation(const std::vector<double>&)> evaluate;
};

struct SqpOptions {
    int max_iterations;
    double ftol;                // Objective change accepted as converged
    double ctol;                // Constraint violation accepted as feasible
    double fd_step;             // Relative finite-difference step

    SqpOptions();
};

struct SqpResult {
    std::vector<double> x;
    double objective;
    std::vector<double> constraints;
    double max_violation;
    bool converged;
    std::string message;
    int iterations;
    int evaluations;

    SqpResult();
};

// Sequential quadratic programming with forward-difference gradients,
// damped BFGS Hessian updates, an active-set QP subproblem that relaxes
// incompatible linearized constraints, and an L1 merit line search.
//
// Iterates always stay inside the bounds. Without convergence the best
// iterate (least violation, then lowest objective) is returned.
class SqpSolver {
public:
    explicit SqpSolver(const SqpOptions& options = SqpOptions());

    SqpResult minimize(const SqpProblem& problem, const std::vector<double>& x0) const;

    const SqpOptions& options() const { return options_; }

private:
    SqpOptions options_;
};

} // namespace powerfin

#endif // POWERFIN_SQP_SOLVER_HPP
