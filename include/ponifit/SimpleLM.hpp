#pragma once
#include <Eigen/Core>
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <vector>

namespace ponifit {

/* ---------------------------  user visible bits  --------------------------- */
/*  A tolerance ≤ 0 means "derive it from the starting point".                */

struct LMSolverOptions {
    int    max_iterations        = 200;      // Jacobian evaluations
    double gradient_tolerance    = 0;        // on max |Jᵀr|
    double step_tolerance        = 0;        // on max |Δx|
    double chi2_tolerance        = 0;        // on predicted χ² decrease
    double initial_lambda        = 0;        // damping at iteration 0
    bool   verbose               = false;
};

struct LMSolverSummary {
    int    iterations         = 0;
    int    rejected_steps     = 0;
    double initial_chi2       = 0.0;
    double final_chi2         = 0.0;
    bool   converged          = false;
    std::vector<double> param_uncertainties;   // 1-σ, 0 for frozen entries
};

/* --------------------  free-parameter bookkeeping  ------------------------- */
/*  map[j] = column of parameter j in the reduced problem, −1 when frozen.    */
/*  An empty mask frees everything.                                           */

inline
void build_free_index(const std::vector<bool>& mask,
                      int                      n,
                      Eigen::VectorXi&         map,
                      int&                     n_free)
{
    map.resize(n);
    n_free = 0;
    for (int j = 0; j < n; ++j)
        map[j] = (mask.empty() || mask[j]) ? n_free++ : -1;
}

namespace detail {

inline void reduce_columns(const Eigen::MatrixXd& J,
                           const Eigen::VectorXi& map,
                           Eigen::MatrixXd&       Jf)
{
    for (int j = 0; j < map.size(); ++j)
        if (map[j] >= 0) Jf.col(map[j]) = J.col(j);
}

inline Eigen::MatrixXd normal_matrix(const Eigen::MatrixXd& Jf)
{
    Eigen::MatrixXd N = Eigen::MatrixXd::Zero(Jf.cols(), Jf.cols());
    N.selfadjointView<Eigen::Lower>().rankUpdate(Jf.transpose());
    return N.selfadjointView<Eigen::Lower>();
}

/*  σ_j = sqrt( s² · (JᵀJ)⁻¹_jj ),  s² = χ² / (m − n_free)                  */
inline void fill_uncertainties(const Eigen::MatrixXd& Jf,
                               const Eigen::VectorXi& map,
                               double                 chi2,
                               std::vector<double>&   sigma)
{
    const Eigen::Index m   = Jf.rows();
    const Eigen::Index nf  = Jf.cols();
    const double       dof = static_cast<double>(std::max<Eigen::Index>(m - nf, 1));

    const Eigen::MatrixXd cov =
        normal_matrix(Jf).ldlt().solve(Eigen::MatrixXd::Identity(nf, nf)) * (chi2 / dof);

    for (int j = 0; j < map.size(); ++j) {
        const int c = map[j];
        if (c >= 0 && std::isfinite(cov(c, c)))
            sigma[j] = std::sqrt(std::max(0.0, cov(c, c)));
    }
}

} // namespace detail

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*                                                                             */
/*  func(x, &r, &J) fills the residuals and, when J is non-null, the Jacobian */
/*  (rows = residuals, cols = x.size()).                                       */
/*                                                                             */
/*  Damping follows Nielsen: on success λ ← λ·max(⅓, 1 − (2ρ − 1)³) and ν = 2, */
/*  on failure λ ← λ·ν and ν doubles.  The scaling matrix is diag(JᵀJ) with a  */
/*  floor, so columns the residuals hardly depend on (rot3 of an untilted      */
/*  detector) cannot take arbitrarily long steps.                              */
/*  x is only ever replaced by a point with a lower χ².                        */

template<typename Functor>
LMSolverSummary
levenberg_marquardt(Functor&&                    func,
                    Eigen::VectorXd&             x,
                    const std::vector<bool>&     free_mask = {},
                    const std::vector<double>&   lower     = {},
                    const std::vector<double>&   upper     = {},
                    const LMSolverOptions&       opt       = {})
{
    LMSolverSummary summ;
    const int n = static_cast<int>(x.size());
    summ.param_uncertainties.assign(n, 0.0);

    Eigen::VectorXi map;
    int n_free = 0;
    build_free_index(free_mask, n, map, n_free);

    Eigen::VectorXd r;
    Eigen::MatrixXd J;
    func(x, &r, &J);

    double chi2 = r.squaredNorm();
    summ.initial_chi2 = summ.final_chi2 = chi2;

    if (n_free == 0) {
        if (opt.verbose)
            std::cout << "[LM]  every parameter is frozen, nothing to fit\n";
        summ.converged = true;
        return summ;
    }
    if (r.size() == 0 || !std::isfinite(chi2)) {
        std::cout << "[LM]  Warning: no finite residuals at the starting point\n";
        return summ;
    }

    const Eigen::Index m = r.size();
    Eigen::MatrixXd Jf(m, n_free);
    detail::reduce_columns(J, map, Jf);

    Eigen::MatrixXd N = detail::normal_matrix(Jf);
    Eigen::VectorXd g = Jf.transpose() * r;

    /* ---- tolerances relative to the starting point ------------------ */
    const double g_tol = opt.gradient_tolerance > 0.0
                       ? opt.gradient_tolerance
                       : std::max(1e-10 * g.lpNorm<Eigen::Infinity>(), 1e-30);
    const double x_tol = opt.step_tolerance > 0.0
                       ? opt.step_tolerance
                       : 1e-12 * std::max(1.0, x.lpNorm<Eigen::Infinity>());
    const double c_tol = opt.chi2_tolerance > 0.0
                       ? opt.chi2_tolerance
                       : 1e-14 * chi2;

    double lambda = opt.initial_lambda > 0.0
                  ? opt.initial_lambda
                  : std::max(1e-3 * N.diagonal().maxCoeff(), 1e-3);
    double nu = 2.0;

    if (opt.verbose)
        std::cout << "[LM]  start  χ²=" << chi2 << "  free=" << n_free << "\n";

    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;

        if (g.lpNorm<Eigen::Infinity>() < g_tol) {
            summ.converged = true;
            break;
        }

        const double   floor_d = 1e-9 * std::max(N.diagonal().maxCoeff(), 1e-300);
        Eigen::VectorXd D      = N.diagonal().cwiseMax(floor_d);

        Eigen::MatrixXd A = N;
        A.diagonal() += lambda * D;
        Eigen::VectorXd h = A.ldlt().solve(-g);

        if (!h.allFinite()) {
            std::cout << "[LM]  Warning: singular damped system, stopping\n";
            break;
        }

        /* ---- trial point, projected into the box ---------------------- */
        Eigen::VectorXd x_new = x;
        for (int j = 0; j < n; ++j) {
            if (map[j] < 0) continue;
            double v = x[j] + h[map[j]];
            if (!lower.empty()) v = std::max(v, lower[j]);
            if (!upper.empty()) v = std::min(v, upper[j]);
            x_new[j] = v;
        }
        for (int j = 0; j < n; ++j)
            if (map[j] >= 0) h[map[j]] = x_new[j] - x[j];

        if (h.lpNorm<Eigen::Infinity>() < x_tol) {
            summ.converged = true;
            break;
        }

        Eigen::VectorXd r_new;
        Eigen::MatrixXd J_new;
        func(x_new, &r_new, &J_new);
        const double chi2_new = r_new.squaredNorm();

        // model decrease  −(2hᵀg + hᵀNh) = hᵀ(λDh − g)  for the damped step
        double predicted = h.dot(lambda * D.cwiseProduct(h) - g);
        if (!(predicted > 0.0)) predicted = std::numeric_limits<double>::epsilon();
        const double rho = (chi2 - chi2_new) / predicted;

        if (std::isfinite(chi2_new) && chi2_new < chi2 && rho > 0.0) {
            x    = x_new;
            r    = r_new;
            chi2 = chi2_new;
            detail::reduce_columns(J_new, map, Jf);
            N = detail::normal_matrix(Jf);
            g = Jf.transpose() * r;

            lambda *= std::max(1.0 / 3.0, 1.0 - std::pow(2.0 * rho - 1.0, 3));
            lambda  = std::max(lambda, 1e-18);
            nu      = 2.0;

            if (opt.verbose)
                std::cout << "[LM]  iter " << it << "  χ²=" << std::scientific
                          << std::setprecision(4) << chi2 << "  λ=" << lambda
                          << std::defaultfloat << "\n";

            if (predicted < c_tol) {
                summ.converged = true;
                break;
            }
        } else {
            ++summ.rejected_steps;
            lambda *= nu;
            nu     *= 2.0;
            if (opt.verbose)
                std::cout << "[LM]  iter " << it << "  rejected, λ=" << std::scientific
                          << std::setprecision(4) << lambda << std::defaultfloat << "\n";
            if (!std::isfinite(lambda) || lambda > 1e300) break;
        }
    }

    summ.final_chi2 = chi2;
    detail::fill_uncertainties(Jf, map, chi2, summ.param_uncertainties);
    return summ;
}

} // namespace ponifit
