#include "ponifit/Strategies.hpp"
#include "ponifit/NelderMead.hpp"
#include "ponifit/Powell.hpp"
#include <iostream>

namespace ponifit {

Vector propose_least_squares(const RingResiduals&   residuals,
                             const PoseParameters&  pose,
                             const LMSolverOptions& options,
                             LMSolverSummary*       summary)
{
    Vector x = pose.to_vector6();
    LMSolverSummary summ = levenberg_marquardt(residuals, x, {}, {}, {}, options);
    if (summary) *summary = summ;
    return x;
}

/* ----------------------------------------------------------------------- */
Vector propose_bounded(const RingResiduals&  residuals,
                       const PoseParameters& pose,
                       const BoundsState&    bounds,
                       const FixedSet&       fix,
                       bool                  with_wavelength,
                       int                   max_iterations,
                       bool                  verbose)
{
    const int n = with_wavelength ? kNParams : kNPoseParams;
    Vector x = with_wavelength ? pose.to_vector7() : pose.to_vector6();

    std::vector<double> lower, upper;
    bounds.collapsed(pose, fix, n, lower, upper);

    std::vector<bool> free_mask(n, true);
    for (Param p : fix)
        if (index_of(p) < n) free_mask[index_of(p)] = false;

    PowellSolverOptions opt;
    opt.max_iterations = max_iterations;
    opt.verbose        = verbose;

    auto objective = [&residuals](const Eigen::VectorXd& p) {
        return residuals.objective(p);
    };
    const PowellSolverSummary summ = powell(objective, x, free_mask, lower, upper, opt);

    if (verbose)
        std::cout << "[Powell] " << summ.iterations << " iterations, "
                  << summ.function_evals << " evaluations, "
                  << summ.initial_value << " -> " << summ.final_value << "\n";
    return x;
}

/* ----------------------------------------------------------------------- */
Vector propose_simplex(const RingResiduals&  residuals,
                       const PoseParameters& pose,
                       int                   max_iterations,
                       double                x_tolerance,
                       bool                  verbose)
{
    Vector x = pose.to_vector6();

    SimplexSolverOptions opt;
    opt.max_iterations = max_iterations;
    opt.x_tolerance    = x_tolerance;
    opt.verbose        = verbose;

    nelder_mead([&residuals](const Eigen::VectorXd& p) { return residuals.sum_squares(p); },
                x, opt);
    return x;
}

/* ----------------------------------------------------------------------- */
Vector propose_anneal(const RingResiduals&  residuals,
                      const PoseParameters& pose,
                      const BoundsState&    bounds,
                      const AnnealOptions&  options)
{
    Vector x = pose.to_vector6();

    std::vector<double> lower(kNPoseParams), upper(kNPoseParams);
    for (int i = 0; i < kNPoseParams; ++i) {
        lower[i] = bounds.min(static_cast<Param>(i));
        upper[i] = bounds.max(static_cast<Param>(i));
    }

    const AnnealSummary summ = simulated_annealing(
        [&residuals](const Eigen::VectorXd& p) { return residuals.sum_squares(p); },
        x, lower, upper, options);

    if (options.verbose)
        std::cout << "[Anneal] " << summ.iterations << " levels, "
                  << summ.function_evals << " evaluations, "
                  << summ.accepted << " accepted\n";
    return x;
}

} // namespace ponifit
