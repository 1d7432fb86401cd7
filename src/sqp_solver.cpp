#include "sqp_solver.hpp"
#include "logger.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace powerfin {

SqpOptions::SqpOptions()
    : max_iterations(150), ftol(1e-4), ctol(1e-4), fd_step(1e-6) {}

SqpResult::SqpResult()
    : objective(0.0), max_violation(0.0), converged(false), iterations(0), evaluations(0) {}

SqpSolver::SqpSolver(const SqpOptions& options)
    : options_(options) {
    if (options_.max_iterations <= 0) {
        throw std::invalid_argument("max_iterations must be positive");
    }
    if (options_.ftol <= 0.0 || options_.ctol <= 0.0 || options_.fd_step <= 0.0) {
        throw std::invalid_argument("SQP tolerances must be positive");
    }
}

namespace {

using Eigen::MatrixXd;
using Eigen::VectorXd;

// Tolerances of the QP subproblem
constexpr double MULTIPLIER_TOL = 1e-10;
constexpr double FEASIBILITY_TOL = 1e-9;
constexpr double MIN_STEP_NORM = 1e-10;
constexpr double MIN_LINE_SEARCH_STEP = 1e-3;
constexpr double ARMIJO = 1e-4;

struct Point {
    VectorXd x;
    double objective;
    VectorXd constraints;
};

struct Gradients {
    VectorXd objective;
    MatrixXd jacobian;      // rows: constraints
};

struct QpSolution {
    VectorXd step;
    VectorXd multipliers;   // One per row of A
    double value;
};

std::vector<double> to_std(const VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

double total_violation(const VectorXd& c) {
    double total = 0.0;
    for (Eigen::Index i = 0; i < c.size(); ++i) {
        total += std::max(0.0, -c(i));
    }
    return total;
}

double max_violation(const VectorXd& c) {
    double worst = 0.0;
    for (Eigen::Index i = 0; i < c.size(); ++i) {
        worst = std::max(worst, -c(i));
    }
    return worst;
}

VectorXd clamp(const VectorXd& x, const VectorXd& lower, const VectorXd& upper) {
    return x.cwiseMax(lower).cwiseMin(upper);
}

// Calls fn with each k-subset of {0, ..., m-1} in lexicographic order
template<typename Fn>
void for_each_subset(int m, int k, Fn&& fn) {
    std::vector<int> idx(static_cast<size_t>(k));
    for (int i = 0; i < k; ++i) idx[static_cast<size_t>(i)] = i;
    while (true) {
        fn(idx);
        int i = k - 1;
        while (i >= 0 && idx[static_cast<size_t>(i)] == m - k + i) --i;
        if (i < 0) return;
        ++idx[static_cast<size_t>(i)];
        for (int j = i + 1; j < k; ++j) {
            idx[static_cast<size_t>(j)] = idx[static_cast<size_t>(j - 1)] + 1;
        }
    }
}

// min 1/2 d'Bd + g'd  subject to  A d >= b, by enumerating active sets of
// at most n rows and keeping the best KKT point with non-negative multipliers
bool solve_qp(const MatrixXd& B, const VectorXd& g, const MatrixXd& A, const VectorXd& b,
              QpSolution& best) {
    const int n = static_cast<int>(g.size());
    const int m = static_cast<int>(A.rows());
    bool found = false;
    best.value = std::numeric_limits<double>::infinity();

    for (int k = 0; k <= std::min(n, m); ++k) {
        for_each_subset(m, k, [&](const std::vector<int>& active) {
            const int size = n + k;
            MatrixXd kkt = MatrixXd::Zero(size, size);
            VectorXd rhs(size);
            kkt.topLeftCorner(n, n) = B;
            rhs.head(n) = -g;
            for (int a = 0; a < k; ++a) {
                const int row = active[static_cast<size_t>(a)];
                kkt.block(0, n + a, n, 1) = -A.row(row).transpose();
                kkt.block(n + a, 0, 1, n) = A.row(row);
                rhs(n + a) = b(row);
            }

            Eigen::FullPivLU<MatrixXd> lu(kkt);
            if (!lu.isInvertible()) {
                return;
            }
            VectorXd solution = lu.solve(rhs);
            VectorXd d = solution.head(n);
            VectorXd lambda = solution.tail(k);

            if (k > 0 && lambda.minCoeff() < -MULTIPLIER_TOL) {
                return;
            }
            VectorXd slack = A * d - b;
            if (m > 0 && slack.minCoeff() < -FEASIBILITY_TOL) {
                return;
            }

            double value = 0.5 * d.dot(B * d) + g.dot(d);
            if (value < best.value) {
                best.value = value;
                best.step = d;
                best.multipliers = VectorXd::Zero(m);
                for (int a = 0; a < k; ++a) {
                    best.multipliers(active[static_cast<size_t>(a)]) = lambda(a);
                }
                found = true;
            }
        });
    }
    return found;
}

// Feasible iterates beat infeasible ones, then lower objective / violation
bool better(const Point& a, const Point& b, double ctol) {
    double va = max_violation(a.constraints);
    double vb = max_violation(b.constraints);
    bool fa = va <= ctol;
    bool fb = vb <= ctol;
    if (fa && fb) return a.objective < b.objective;
    if (fa != fb) return fa;
    return va < vb;
}

} // anonymous namespace

SqpResult SqpSolver::minimize(const SqpProblem& problem, const std::vector<double>& x0) const {
    const size_t n = x0.size();
    if (n == 0) {
        throw std::invalid_argument("SQP problem has no variables");
    }
    if (problem.lower.size() != n || problem.upper.size() != n) {
        throw std::invalid_argument("SQP bounds must match the number of variables");
    }
    if (!problem.evaluate) {
        throw std::invalid_argument("SQP problem has no evaluation function");
    }
    for (size_t j = 0; j < n; ++j) {
        if (!(problem.lower[j] <= problem.upper[j])) {
            throw std::invalid_argument("SQP lower bound exceeds upper bound");
        }
    }

    const Eigen::Index dim = static_cast<Eigen::Index>(n);
    const VectorXd lower = Eigen::Map<const VectorXd>(problem.lower.data(), dim);
    const VectorXd upper = Eigen::Map<const VectorXd>(problem.upper.data(), dim);

    SqpResult result;
    Eigen::Index m = -1;

    auto evaluate = [&](const VectorXd& x) {
        SqpEvaluation e = problem.evaluate(to_std(x));
        ++result.evaluations;
        if (m < 0) {
            m = static_cast<Eigen::Index>(e.constraints.size());
        } else if (static_cast<Eigen::Index>(e.constraints.size()) != m) {
            throw std::runtime_error("SQP constraint count changed between evaluations");
        }
        Point p;
        p.x = x;
        p.objective = e.objective;
        p.constraints = Eigen::Map<const VectorXd>(e.constraints.data(), m);
        return p;
    };

    auto gradients = [&](const Point& p) {
        Gradients grad;
        grad.objective = VectorXd::Zero(dim);
        grad.jacobian = MatrixXd::Zero(m, dim);
        for (Eigen::Index j = 0; j < dim; ++j) {
            double h = options_.fd_step * std::max(1.0, std::abs(p.x(j)));
            // A variable pinned by its bounds keeps a zero gradient column
            if (upper(j) - lower(j) < h) {
                continue;
            }
            if (p.x(j) + h > upper(j)) {
                if (p.x(j) - h >= lower(j)) {
                    h = -h;
                } else {
                    h = upper(j) - p.x(j) >= p.x(j) - lower(j) ? upper(j) - p.x(j) : lower(j) - p.x(j);
                }
            }
            VectorXd shifted = p.x;
            shifted(j) += h;
            Point q = evaluate(shifted);
            grad.objective(j) = (q.objective - p.objective) / h;
            grad.jacobian.col(j) = (q.constraints - p.constraints) / h;
        }
        return grad;
    };

    Point current = evaluate(clamp(Eigen::Map<const VectorXd>(x0.data(), dim), lower, upper));
    Point best = current;
    Gradients grad = gradients(current);
    MatrixXd hessian = MatrixXd::Identity(dim, dim);
    double penalty = 0.0;

    Logger& logger = Logger::get_instance();
    result.message = "Iteration limit reached";

    const double relaxations[] = {1.0, 0.5, 0.25, 0.1, 0.0};

    for (int iter = 1; iter <= options_.max_iterations; ++iter) {
        result.iterations = iter;

        // Linearized constraints and bounds as rows of A d >= b
        MatrixXd A(m + 2 * dim, dim);
        VectorXd b(m + 2 * dim);
        A.topRows(m) = grad.jacobian;
        A.middleRows(m, dim) = MatrixXd::Identity(dim, dim);
        A.bottomRows(dim) = -MatrixXd::Identity(dim, dim);
        b.segment(m, dim) = lower - current.x;
        b.tail(dim) = current.x - upper;

        QpSolution qp;
        bool solved = false;
        for (double tau : relaxations) {
            for (Eigen::Index i = 0; i < m; ++i) {
                double c = current.constraints(i);
                b(i) = -c + (1.0 - tau) * std::min(c, 0.0);
            }
            if (solve_qp(hessian, grad.objective, A, b, qp)) {
                solved = true;
                break;
            }
        }
        if (!solved) {
            result.message = "QP subproblem failed";
            break;
        }

        const VectorXd& d = qp.step;
        VectorXd lambda = qp.multipliers.head(m);
        double lambda_max = m > 0 ? lambda.cwiseAbs().maxCoeff() : 0.0;
        penalty = std::max(lambda_max, 0.5 * (penalty + lambda_max));

        // Backtracking on the L1 merit function
        const double merit0 = current.objective + penalty * total_violation(current.constraints);
        const double slope = grad.objective.dot(d) - penalty * total_violation(current.constraints);
        double alpha = 1.0;
        Point next;
        bool accepted = false;
        while (alpha >= MIN_LINE_SEARCH_STEP) {
            next = evaluate(clamp(current.x + alpha * d, lower, upper));
            double merit = next.objective + penalty * total_violation(next.constraints);
            if (merit <= merit0 + ARMIJO * alpha * std::min(slope, 0.0)) {
                accepted = true;
                break;
            }
            alpha *= 0.5;
        }
        if (!accepted) {
            next = evaluate(clamp(current.x + alpha * d, lower, upper));
        }

        const VectorXd s = next.x - current.x;
        Gradients next_grad = gradients(next);

        // Damped BFGS on the Lagrangian gradient
        VectorXd y = (next_grad.objective - next_grad.jacobian.transpose() * lambda) -
                     (grad.objective - grad.jacobian.transpose() * lambda);
        VectorXd Bs = hessian * s;
        double sBs = s.dot(Bs);
        if (sBs > 1e-16) {
            double sy = s.dot(y);
            double theta = sy >= 0.2 * sBs ? 1.0 : 0.8 * sBs / (sBs - sy);
            VectorXd r = theta * y + (1.0 - theta) * Bs;
            double sr = s.dot(r);
            if (sr > 1e-16) {
                hessian += -(Bs * Bs.transpose()) / sBs + (r * r.transpose()) / sr;
            }
        }

        const double objective_change = std::abs(next.objective - current.objective);
        current = next;
        grad = next_grad;
        if (better(current, best, options_.ctol)) {
            best = current;
        }

        const double violation = max_violation(current.constraints);
        const double step_norm = s.norm();
        logger.log_optimizer_iteration(iter, to_std(current.x), current.objective, violation, step_norm);

        // An unaccepted fallback step only counts when the QP step itself vanished
        const bool settled = accepted || d.lpNorm<Eigen::Infinity>() < options_.ftol;
        if (settled && objective_change < options_.ftol && violation <= options_.ctol) {
            result.converged = true;
            result.message = "Optimization terminated successfully";
            break;
        }
        if (step_norm < MIN_STEP_NORM) {
            if (violation <= options_.ctol) {
                result.converged = true;
                result.message = "Optimization terminated successfully";
            } else {
                result.message = "Inequality constraints incompatible";
            }
            break;
        }
    }

    const Point& chosen = result.converged ? current : best;
    result.x = to_std(chosen.x);
    result.objective = chosen.objective;
    result.constraints = to_std(chosen.constraints);
    result.max_violation = max_violation(chosen.constraints);
    return result;
}

} // namespace powerfin
