#pragma once
#include "SimpleLM.hpp"              // build_free_index
#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <utility>
#include <vector>

namespace ponifit {

/* ---------------------------  user visible bits  --------------------------- */

struct PowellSolverOptions {
    int    max_iterations        = 200;      // sweeps over all directions
    int    max_function_evals    = 50000;
    double relative_tolerance    = 1e-12;    // on the objective
    double absolute_tolerance    = 1e-12;
    bool   verbose               = false;
};

struct PowellSolverSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    bool   converged          = false;
};

namespace detail {

/* ------------------------------------------------------------------------- */
/*  Objective restricted to the line  p + t·d  inside the box.               */
/* ------------------------------------------------------------------------- */
class BoxLine {
public:
    using Objective = std::function<double(const Eigen::VectorXd&)>;

    BoxLine(const Eigen::VectorXd& origin,
            const Eigen::VectorXd& dir,
            const Eigen::VectorXd& lo,
            const Eigen::VectorXd& hi,
            const Objective&       f,
            int&                   nfe)
        : p_(origin), d_(dir), lo_(lo), hi_(hi), f_(f), nfe_(nfe)
    {
        t_min_ = -std::numeric_limits<double>::infinity();
        t_max_ =  std::numeric_limits<double>::infinity();
        for (Eigen::Index i = 0; i < p_.size(); ++i) {
            if (d_[i] == 0.0) continue;
            double a = (lo_[i] - p_[i]) / d_[i];
            double b = (hi_[i] - p_[i]) / d_[i];
            if (a > b) std::swap(a, b);
            t_min_ = std::max(t_min_, a);
            t_max_ = std::min(t_max_, b);
        }
    }

    double t_min() const { return t_min_; }
    double t_max() const { return t_max_; }
    double clamp(double t) const { return std::max(t_min_, std::min(t_max_, t)); }

    /* out-of-box and NaN count as +inf */
    double operator()(double t) const
    {
        ++nfe_;
        const Eigen::VectorXd q = p_ + t * d_;
        for (Eigen::Index i = 0; i < q.size(); ++i)
            if (q[i] < lo_[i] || q[i] > hi_[i])
                return std::numeric_limits<double>::infinity();
        const double v = f_(q);
        return std::isnan(v) ? std::numeric_limits<double>::infinity() : v;
    }

private:
    const Eigen::VectorXd& p_;
    const Eigen::VectorXd& d_;
    const Eigen::VectorXd& lo_;
    const Eigen::VectorXd& hi_;
    const Objective&       f_;
    int&                   nfe_;
    double                 t_min_, t_max_;
};

/*  Minimise along a line starting from t = 0 with known value f0.
 *
 *  1) bracket: try ±step, then walk downhill with golden-ratio growth
 *     until the value rises again or the box edge is reached;
 *  2) Brent's parabolic / golden-section search inside the bracket.
 *
 *  Returns (t, f(t)); t = 0 when nothing better was found.             */
inline std::pair<double, double>
line_minimize(const BoxLine& line, double step, double f0, int& nfe, int max_nfe)
{
    const double gold  = 1.618033988749895;
    const double cgold = 0.3819660112501051;
    const double eps   = std::sqrt(std::numeric_limits<double>::epsilon());

    if (!(line.t_min() < line.t_max()) || step <= 0.0)
        return { 0.0, f0 };

    double best_t = 0.0, best_f = f0;
    auto sample = [&](double t) {
        const double v = line(t);
        if (v < best_f) { best_f = v; best_t = t; }
        return v;
    };

    /* ---- 1) bracket -------------------------------------------------- */
    const double tp = line.clamp( step);
    const double tm = line.clamp(-step);
    const double fp = (tp != 0.0) ? sample(tp) : f0;
    if (nfe >= max_nfe) return { best_t, best_f };
    const double fm = (tm != 0.0 && !(fp < f0)) ? sample(tm) : std::numeric_limits<double>::infinity();

    double a, b;                          // bracket, a < b
    if (!(fp < f0) && !(fm < f0)) {
        a = tm;
        b = tp;
    } else {
        const double dir = (fp < f0) ? 1.0 : -1.0;
        double t_prev = 0.0;
        double t_cur  = (dir > 0.0) ? tp : tm;
        double f_cur  = (dir > 0.0) ? fp : fm;
        double t_next = t_cur;
        for (;;) {
            t_next = line.clamp(t_cur + gold * (t_cur - t_prev));
            if (t_next == t_cur || nfe >= max_nfe) break;   // box edge
            const double f_next = sample(t_next);
            if (!(f_next < f_cur)) break;
            t_prev = t_cur;
            t_cur  = t_next;
            f_cur  = f_next;
        }
        a = std::min(t_prev, t_next);
        b = std::max(t_prev, t_next);
    }
    if (!(a < b) || nfe >= max_nfe)
        return { best_t, best_f };

    /* ---- 2) Brent --------------------------------------------------- */
    double x = best_t, w = best_t, v = best_t;
    double fx = best_f, fw = best_f, fv = best_f;
    double d = 0.0, e = 0.0;

    for (int it = 0; it < 100 && nfe < max_nfe; ++it) {
        const double xm   = 0.5 * (a + b);
        const double tol1 = eps * std::abs(x) + 1e-14;
        const double tol2 = 2.0 * tol1;
        if (std::abs(x - xm) <= tol2 - 0.5 * (b - a))
            break;

        bool golden = true;
        if (std::abs(e) > tol1) {
            double r = (x - w) * (fx - fv);
            double q = (x - v) * (fx - fw);
            double p = (x - v) * q - (x - w) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) p = -p;
            q = std::abs(q);
            const double e_old = e;
            e = d;
            if (std::isfinite(p) && std::isfinite(q) &&
                std::abs(p) < std::abs(0.5 * q * e_old) &&
                p > q * (a - x) && p < q * (b - x))
            {
                d = p / q;
                const double u = x + d;
                if (u - a < tol2 || b - u < tol2)
                    d = (xm >= x) ? tol1 : -tol1;
                golden = false;
            }
        }
        if (golden) {
            e = (x >= xm) ? a - x : b - x;
            d = cgold * e;
        }

        const double u  = (std::abs(d) >= tol1) ? x + d : x + (d > 0.0 ? tol1 : -tol1);
        const double fu = sample(u);

        if (fu <= fx) {
            if (u >= x) a = x; else b = x;
            v = w; fv = fw;
            w = x; fw = fx;
            x = u; fx = fu;
        } else {
            if (u < x) a = u; else b = u;
            if (fu <= fw || w == x) {
                v = w; fv = fw;
                w = u; fw = fu;
            } else if (fu <= fv || v == x || v == w) {
                v = u; fv = fu;
            }
        }
    }
    return { best_t, best_f };
}

} // namespace detail

/* -------------------  Powell's method driver routine  ---------------------- */
/*                                                                             */
/*  Direction-set minimisation of a scalar objective inside a box.  Starts   */
/*  with the coordinate axes of the free parameters; after every sweep the   */
/*  net displacement replaces the direction of largest decrease when the     */
/*  usual extrapolation test allows it.  Parameters outside the free mask    */
/*  never move.  x is clamped into the box first and afterwards only moves   */
/*  to points with a lower objective.                                        */

template<typename Objective>
PowellSolverSummary
powell(Objective&&                  objective,
       Eigen::VectorXd&             x,
       const std::vector<bool>&     free_mask,
       const std::vector<double>&   lower,
       const std::vector<double>&   upper,
       const PowellSolverOptions&   opt = {})
{
    PowellSolverSummary summ;
    const int n = static_cast<int>(x.size());

    Eigen::VectorXi map;
    int n_free = 0;
    build_free_index(free_mask, n, map, n_free);

    Eigen::VectorXd lo(n), hi(n);
    for (int i = 0; i < n; ++i) {
        lo[i] = lower.empty() ? -1e10 : lower[i];
        hi[i] = upper.empty() ?  1e10 : upper[i];
        x[i]  = std::max(lo[i], std::min(hi[i], x[i]));
    }

    const std::function<double(const Eigen::VectorXd&)> f =
        [&objective](const Eigen::VectorXd& p) -> double { return objective(p); };

    double fx = f(x);
    if (std::isnan(fx)) fx = std::numeric_limits<double>::infinity();
    summ.function_evals = 1;
    summ.initial_value  = summ.final_value = fx;

    if (n_free == 0) {
        if (opt.verbose)
            std::cout << "[Powell] every parameter is frozen\n";
        summ.converged = true;
        return summ;
    }

    std::vector<Eigen::VectorXd> dirs;
    std::vector<double>          steps;
    for (int j = 0; j < n; ++j) {
        if (map[j] < 0) continue;
        dirs.push_back(Eigen::VectorXd::Unit(n, j));
        steps.push_back(x[j] != 0.0 ? 0.01 * std::abs(x[j]) : 0.01);
    }

    for (int it = 0; it < opt.max_iterations; ++it) {
        summ.iterations = it + 1;
        if (summ.function_evals >= opt.max_function_evals) {
            if (opt.verbose)
                std::cout << "[Powell] evaluation budget exhausted\n";
            break;
        }

        const Eigen::VectorXd x_start = x;
        const double          f_start = fx;
        double largest_drop = 0.0;
        int    i_largest    = 0;

        for (int i = 0; i < n_free; ++i) {
            const detail::BoxLine line(x, dirs[i], lo, hi, f, summ.function_evals);
            const auto [t, ft] = detail::line_minimize(line, steps[i], fx,
                                                       summ.function_evals,
                                                       opt.max_function_evals);
            if (t != 0.0 && ft < fx) {
                x += t * dirs[i];
                steps[i] = std::abs(t);
                if (fx - ft > largest_drop) {
                    largest_drop = fx - ft;
                    i_largest    = i;
                }
                fx = ft;
            }
        }

        if (opt.verbose)
            std::cout << "[Powell] sweep " << it << "  f=" << fx
                      << "  nfe=" << summ.function_evals << "\n";

        if (2.0 * (f_start - fx) <=
            opt.relative_tolerance * (std::abs(f_start) + std::abs(fx)) + opt.absolute_tolerance)
        {
            summ.converged = true;
            break;
        }

        /* ---- extrapolated point and direction replacement ------------- */
        Eigen::VectorXd shift = x - x_start;
        Eigen::VectorXd x_ext = x + shift;
        bool inside = true;
        for (int i = 0; i < n; ++i)
            inside = inside && x_ext[i] >= lo[i] && x_ext[i] <= hi[i];
        double f_ext = std::numeric_limits<double>::infinity();
        if (inside) {
            f_ext = f(x_ext);
            ++summ.function_evals;
            if (std::isnan(f_ext)) f_ext = std::numeric_limits<double>::infinity();
        }

        if (f_ext < f_start) {
            const double a = f_start - fx - largest_drop;
            const double b = f_start - f_ext;
            const double test = 2.0 * (f_start - 2.0 * fx + f_ext) * a * a
                              - largest_drop * b * b;
            const double len = shift.norm();
            if (test < 0.0 && len > 0.0) {
                shift /= len;
                const detail::BoxLine line(x, shift, lo, hi, f, summ.function_evals);
                const auto [t, ft] = detail::line_minimize(line, len, fx,
                                                           summ.function_evals,
                                                           opt.max_function_evals);
                if (t != 0.0 && ft < fx) {
                    x += t * shift;
                    fx = ft;
                }
                dirs[i_largest]  = dirs.back();
                steps[i_largest] = steps.back();
                dirs.back()      = shift;
                steps.back()     = std::max(std::abs(t), 1e-12);
            }
        }
    }

    summ.final_value = fx;
    if (opt.verbose && !summ.converged)
        std::cout << "[Powell] stopped after " << summ.iterations
                  << " sweeps without convergence\n";
    return summ;
}

} // namespace ponifit
