#pragma once
/*
 * Candidate generators behind the refinement engine.
 *
 * Each function is pure: it reads the current pose (and bounds), runs one
 * optimiser and returns the candidate vector.  Deciding whether the
 * candidate is kept is the engine's business.
 */

#include "Types.hpp"
#include "PoseParameters.hpp"
#include "RingResiduals.hpp"
#include "SimpleLM.hpp"
#include "Annealing.hpp"

namespace ponifit {

/* unconstrained Levenberg–Marquardt on the residual vector, 6 parameters */
Vector propose_least_squares(const RingResiduals&   residuals,
                             const PoseParameters&  pose,
                             const LMSolverOptions& options,
                             LMSolverSummary*       summary = nullptr);

/*  bounded Powell on the scalar objective (weighted when the dataset
 *  carries weights).  with_wavelength selects the 7-vector in optimiser
 *  units; parameters in `fix` are frozen at their current value.        */
Vector propose_bounded(const RingResiduals&  residuals,
                       const PoseParameters& pose,
                       const BoundsState&    bounds,
                       const FixedSet&       fix,
                       bool                  with_wavelength,
                       int                   max_iterations,
                       bool                  verbose = false);

/* Nelder–Mead on the unweighted sum of squares, 6 parameters */
Vector propose_simplex(const RingResiduals&  residuals,
                       const PoseParameters& pose,
                       int                   max_iterations,
                       double                x_tolerance = 1e-12,
                       bool                  verbose     = false);

/* simulated annealing on the unweighted sum of squares inside the
   current bounds, 6 parameters */
Vector propose_anneal(const RingResiduals&  residuals,
                      const PoseParameters& pose,
                      const BoundsState&    bounds,
                      const AnnealOptions&  options);

} // namespace ponifit
