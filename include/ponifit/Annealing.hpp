#pragma once
#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

namespace ponifit {

/* ---------------------------  user visible bits  --------------------------- */

struct AnnealOptions {
    int           max_iterations     = 400;     // temperature levels
    int           max_function_evals = -1;      // < 0 -> unlimited
    int           dwell              = 50;      // trials per temperature
    double        t_initial          = 0.0;     // ≤ 0 -> estimated from the box
    double        t_final            = 1e-12;
    double        f_tolerance        = 1e-6;    // relative stall criterion on the current value
    double        quench             = 1.0;
    double        m                  = 1.0;
    double        n                  = 1.0;
    std::uint64_t seed               = 42;
    bool          verbose            = false;
};

struct AnnealSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    int    accepted           = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    double t_initial          = 0.0;
    bool   converged          = false;
};

/* ----------------------  simulated annealing ("fast")  --------------------- */
/*                                                                             */
/*  T_k = T0 · exp(−c · k^quench),  c = m · exp(−n · quench).                  */
/*  Trial step per coordinate:                                                 */
/*      y = sgn(u−½) · T · ((1 + 1/T)^|2u−1| − 1),   |y| ≤ 1,                 */
/*      x' = clamp(x + y · (upper − lower)).                                   */
/*  Early, hot levels explore the whole box; later levels only take small     */
/*  steps around the current state.  Acceptance follows Metropolis.  The best */
/*  point ever seen is returned; x is left untouched unless it was improved.  */

template<typename Objective>
AnnealSummary
simulated_annealing(Objective&&                 objective,
                    Eigen::VectorXd&            x,
                    const std::vector<double>&  lower,
                    const std::vector<double>&  upper,
                    const AnnealOptions&        opt = {})
{
    AnnealSummary summ;
    const int n = static_cast<int>(x.size());
    if (static_cast<int>(lower.size()) != n || static_cast<int>(upper.size()) != n)
        throw std::invalid_argument("simulated_annealing: bounds do not match parameter count");

    std::mt19937_64 rng(opt.seed);
    std::uniform_real_distribution<double> uni(0.0, 1.0);

    auto eval = [&](const Eigen::VectorXd& p) -> double {
        ++summ.function_evals;
        const double f = objective(p);
        return std::isnan(f) ? std::numeric_limits<double>::infinity() : f;
    };
    auto budget_left = [&]() {
        return opt.max_function_evals < 0 ||
               summ.function_evals < opt.max_function_evals;
    };

    Eigen::VectorXd current   = x;
    double          f_current = eval(current);
    Eigen::VectorXd best      = current;
    double          f_best    = f_current;

    summ.initial_value = f_current;
    summ.final_value   = f_current;

    if (opt.max_iterations == 0 || n == 0)
        return summ;

    /* ---------------- starting temperature ------------------------- */
    double t0 = opt.t_initial;
    if (t0 <= 0.0) {
        double fmin = std::numeric_limits<double>::infinity();
        double fmax = -std::numeric_limits<double>::infinity();
        for (int s = 0; s < 50 && budget_left(); ++s) {
            Eigen::VectorXd p(n);
            for (int i = 0; i < n; ++i)
                p[i] = lower[i] + (upper[i] - lower[i]) * uni(rng);
            const double f = eval(p);
            if (!std::isfinite(f)) continue;
            fmin = std::min(fmin, f);
            fmax = std::max(fmax, f);
            if (f < f_best) {
                f_best = f;
                best   = p;
            }
        }
        t0 = 1.5 * (fmax - fmin);
        if (!std::isfinite(t0) || t0 <= 0.0) t0 = 1.0;
    }
    summ.t_initial = t0;

    const double c = opt.m * std::exp(-opt.n * opt.quench);

    if (opt.verbose)
        std::cout << "[Anneal] T0=" << t0 << " f0=" << f_current << "\n";

    /* ---------------- cooling loop --------------------------------- */
    std::deque<double> fqueue;
    for (int k = 0; k < opt.max_iterations && budget_left(); ++k) {
        summ.iterations = k + 1;
        const double T = t0 * std::exp(-c * std::pow(static_cast<double>(k), opt.quench));

        for (int d = 0; d < opt.dwell && budget_left(); ++d) {
            Eigen::VectorXd trial = current;
            for (int i = 0; i < n; ++i) {
                const double u = uni(rng);
                const double sgn = (u - 0.5) < 0.0 ? -1.0 : 1.0;
                const double y = sgn * T *
                    (std::pow(1.0 + 1.0 / T, std::abs(2.0 * u - 1.0)) - 1.0);
                trial[i] = std::clamp(current[i] + y * (upper[i] - lower[i]),
                                      std::min(lower[i], upper[i]),
                                      std::max(lower[i], upper[i]));
            }

            const double f_trial = eval(trial);
            const double delta   = f_trial - f_current;
            if (delta < 0.0 || uni(rng) < std::exp(-delta / T)) {
                current   = trial;
                f_current = f_trial;
                ++summ.accepted;
                if (f_current < f_best) {
                    f_best = f_current;
                    best   = current;
                }
            }
        }

        if (opt.verbose && k % 20 == 0)
            std::cout << "[Anneal] level " << k << " T=" << T
                      << " best=" << f_best
                      << " nfe=" << summ.function_evals << "\n";

        /* stall: the current state stopped moving (relative f_tolerance)
           and sits on the best point seen */
        fqueue.push_back(f_current);
        if (fqueue.size() > 4) fqueue.pop_front();
        if (fqueue.size() == 4) {
            const double ref   = fqueue.front();
            const double scale = std::max(std::abs(ref), std::numeric_limits<double>::min());
            const bool   still = std::all_of(fqueue.begin(), fqueue.end(), [&](double f) {
                return std::abs(f - ref) <= opt.f_tolerance * scale;
            });
            const bool at_best = std::abs(f_current - f_best) <=
                                 opt.f_tolerance * std::max(std::abs(f_best), std::numeric_limits<double>::min());
            if (still && at_best) {
                summ.converged = true;
                break;
            }
        }
        if (T < opt.t_final) {
            summ.converged = true;
            break;
        }
    }

    if (f_best < summ.initial_value) {
        x = best;
        summ.final_value = f_best;
    }
    return summ;
}

} // namespace ponifit
