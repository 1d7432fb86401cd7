#ifndef POWERFIN_ROOT_FINDING_HPP
#define POWERFIN_ROOT_FINDING_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace powerfin {

struct RootFindingConfig {
    size_t max_iter = 200;
    double tol_abs = 1e-12;     // Bracket width / |f| at which the root is accepted
};

struct RootFindingResult {
    bool converged = false;
    size_t iterations = 0;
    double final_error = 0.0;   // |f(root)|
    double root = 0.0;
    std::string failure_reason;
};

// Brent's method on [a, b]: inverse quadratic interpolation and secant
// steps, falling back to bisection whenever the interpolated point is
// not trusted. f(a) and f(b) must have opposite signs.
template<typename F>
RootFindingResult brent_find_root(F&& f, double a, double b,
                                  const RootFindingConfig& config = RootFindingConfig()) {
    RootFindingResult result;
    double fa = f(a);
    double fb = f(b);

    if (!std::isfinite(fa) || !std::isfinite(fb) || fa * fb > 0.0) {
        result.final_error = std::min(std::abs(fa), std::abs(fb));
        result.root = std::abs(fa) < std::abs(fb) ? a : b;
        result.failure_reason = "Root not bracketed";
        return result;
    }

    if (fa == 0.0 || fb == 0.0) {
        result.converged = true;
        result.root = fa == 0.0 ? a : b;
        return result;
    }

    if (std::abs(fa) < std::abs(fb)) {
        std::swap(a, b);
        std::swap(fa, fb);
    }

    double c = a;
    double fc = fa;
    bool mflag = true;
    double d = 0.0;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        if (fb == 0.0 || std::abs(b - a) < config.tol_abs) {
            result.converged = true;
            result.iterations = iter + 1;
            result.final_error = std::abs(fb);
            result.root = b;
            return result;
        }

        double s;
        if (fa != fc && fb != fc) {
            s = a * fb * fc / ((fa - fb) * (fa - fc))
              + b * fa * fc / ((fb - fa) * (fb - fc))
              + c * fa * fb / ((fc - fa) * (fc - fb));
        } else {
            s = b - fb * (b - a) / (fb - fa);
        }

        double quarter = (3.0 * a + b) / 4.0;
        bool outside = !((s > quarter && s < b) || (s < quarter && s > b));
        bool slow_bisect = mflag && std::abs(s - b) >= std::abs(b - c) / 2.0;
        bool slow_interp = !mflag && std::abs(s - b) >= std::abs(c - d) / 2.0;
        bool tiny_bisect = mflag && std::abs(b - c) < config.tol_abs;
        bool tiny_interp = !mflag && std::abs(c - d) < config.tol_abs;

        if (outside || slow_bisect || slow_interp || tiny_bisect || tiny_interp) {
            s = (a + b) / 2.0;
            mflag = true;
        } else {
            mflag = false;
        }

        double fs = f(s);
        d = c;
        c = b;
        fc = fb;

        if (fa * fs < 0.0) {
            b = s;
            fb = fs;
        } else {
            a = s;
            fa = fs;
        }

        if (std::abs(fa) < std::abs(fb)) {
            std::swap(a, b);
            std::swap(fa, fb);
        }
    }

    result.iterations = config.max_iter;
    result.final_error = std::abs(fb);
    result.root = b;
    result.failure_reason = "Max iterations reached";
    return result;
}

} // namespace powerfin

#endif // POWERFIN_ROOT_FINDING_HPP
