#pragma once
#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <vector>

namespace ponifit {

/* ---------------------------  user visible bits  --------------------------- */

struct SimplexSolverOptions {
    int    max_iterations        = -1;       // < 0 -> 200·n
    int    max_function_evals    = -1;       // < 0 -> 200·n
    double x_tolerance           = 1e-4;     // simplex size in x
    double f_tolerance           = 1e-4;     // spread of objective values
    bool   verbose               = false;
};

struct SimplexSolverSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    bool   converged          = false;
};

/* ---------------------  Nelder–Mead downhill simplex  ---------------------- */
/*                                                                             */
/*  Standard coefficients (reflection 1, expansion 2, contraction ½,          */
/*  shrink ½).  The initial simplex perturbs each coordinate by 5 %, or by    */
/*  0.00025 for coordinates that are exactly zero.  Convergence needs both    */
/*  the vertex spread ≤ x_tolerance and the value spread ≤ f_tolerance.       */

template<typename Objective>
SimplexSolverSummary
nelder_mead(Objective&&                 objective,
            Eigen::VectorXd&            x,
            const SimplexSolverOptions& user_opt = {})
{
    SimplexSolverSummary summ;
    const int n = static_cast<int>(x.size());

    SimplexSolverOptions opt = user_opt;
    if (opt.max_iterations     < 0) opt.max_iterations     = 200 * n;
    if (opt.max_function_evals < 0) opt.max_function_evals = 200 * n;

    const double rho = 1.0, chi = 2.0, psi = 0.5, sigma = 0.5;
    const double nonzdelt = 0.05;
    const double zdelt    = 0.00025;

    auto eval = [&](const Eigen::VectorXd& p) -> double {
        ++summ.function_evals;
        const double f = objective(p);
        return std::isnan(f) ? std::numeric_limits<double>::infinity() : f;
    };

    /* ---------------- initial simplex ------------------------------ */
    std::vector<Eigen::VectorXd> sim(n + 1, x);
    std::vector<double>          fsim(n + 1);

    fsim[0] = eval(x);
    summ.initial_value = fsim[0];
    summ.final_value   = fsim[0];

    if (n == 0 || opt.max_iterations == 0)
        return summ;

    for (int k = 0; k < n; ++k) {
        Eigen::VectorXd y = x;
        y[k] = (y[k] != 0.0) ? (1.0 + nonzdelt) * y[k] : zdelt;
        sim[k + 1]  = y;
        fsim[k + 1] = eval(y);
    }

    std::vector<int> order(n + 1);
    auto sort_simplex = [&]() {
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&](int a, int b) { return fsim[a] < fsim[b]; });
        std::vector<Eigen::VectorXd> s2(n + 1);
        std::vector<double>          f2(n + 1);
        for (int i = 0; i <= n; ++i) {
            s2[i] = sim[order[i]];
            f2[i] = fsim[order[i]];
        }
        sim.swap(s2);
        fsim.swap(f2);
    };
    sort_simplex();

    /* ---------------- main loop ------------------------------------ */
    int it = 0;
    while (summ.function_evals < opt.max_function_evals && it < opt.max_iterations) {
        double xspread = 0.0, fspread = 0.0;
        for (int i = 1; i <= n; ++i) {
            xspread = std::max(xspread, (sim[i] - sim[0]).cwiseAbs().maxCoeff());
            fspread = std::max(fspread, std::abs(fsim[0] - fsim[i]));
        }
        if (xspread <= opt.x_tolerance && fspread <= opt.f_tolerance) {
            summ.converged = true;
            break;
        }

        Eigen::VectorXd xbar = Eigen::VectorXd::Zero(n);
        for (int i = 0; i < n; ++i) xbar += sim[i];
        xbar /= static_cast<double>(n);

        const Eigen::VectorXd xr = (1.0 + rho) * xbar - rho * sim[n];
        const double fxr = eval(xr);
        bool doshrink = false;

        if (fxr < fsim[0]) {
            const Eigen::VectorXd xe = (1.0 + rho * chi) * xbar - rho * chi * sim[n];
            const double fxe = eval(xe);
            if (fxe < fxr) { sim[n] = xe; fsim[n] = fxe; }
            else           { sim[n] = xr; fsim[n] = fxr; }
        } else if (fxr < fsim[n - 1]) {
            sim[n] = xr; fsim[n] = fxr;
        } else if (fxr < fsim[n]) {
            // outside contraction
            const Eigen::VectorXd xc = (1.0 + psi * rho) * xbar - psi * rho * sim[n];
            const double fxc = eval(xc);
            if (fxc <= fxr) { sim[n] = xc; fsim[n] = fxc; }
            else            doshrink = true;
        } else {
            // inside contraction
            const Eigen::VectorXd xcc = (1.0 - psi) * xbar + psi * sim[n];
            const double fxcc = eval(xcc);
            if (fxcc < fsim[n]) { sim[n] = xcc; fsim[n] = fxcc; }
            else                doshrink = true;
        }

        if (doshrink) {
            for (int j = 1; j <= n; ++j) {
                sim[j]  = sim[0] + sigma * (sim[j] - sim[0]);
                fsim[j] = eval(sim[j]);
            }
        }

        sort_simplex();
        ++it;

        if (opt.verbose && it % 100 == 0)
            std::cout << "[Simplex] iter " << it << " f=" << fsim[0]
                      << " nfe=" << summ.function_evals << "\n";
    }

    summ.iterations = it;
    if (fsim[0] < summ.initial_value) {
        x = sim[0];
        summ.final_value = fsim[0];
    }

    if (opt.verbose && !summ.converged)
        std::cout << "[Simplex] Maximum number of iterations/evaluations exceeded\n";

    return summ;
}

} // namespace ponifit
