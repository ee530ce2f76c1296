#pragma once
#include "Types.hpp"
#include "Annealing.hpp"
#include "CalibrationDataset.hpp"
#include "ExternalRefiner.hpp"
#include "GeometryModel.hpp"
#include "PoseParameters.hpp"
#include "RingResiduals.hpp"
#include "SimpleLM.hpp"

namespace ponifit {

/* ---------------------------  user visible bits  --------------------------- */

struct RefinementOptions {
    bool            verbose        = false;   // optimiser chatter
    LMSolverOptions least_squares;            // gradient_refine
    double          simplex_xtol   = 1e-12;   // simplex_refine
    AnnealOptions   anneal;                   // anneal_refine (max_iterations is per call)
};

/* ------------------------------------------------------------------------- */
/*  Owns the current pose and the bound table and runs the strategies.       */
/*                                                                           */
/*  Every strategy snapshots the pose, asks one optimiser for a candidate    */
/*  and keeps it only when its χ² is strictly lower.  The return value is    */
/*  the χ² after that decision.  Dataset and geometry are borrowed and must  */
/*  outlive the engine.                                                      */
/* ------------------------------------------------------------------------- */
class RefinementEngine {
public:
    RefinementEngine(const CalibrationDataset& dataset,
                     const GeometryModel&      geometry,
                     const PoseParameters&     initial = {},
                     RefinementOptions         options = {});

    /* ---- strategies ------------------------------------------------- */
    double gradient_refine();
    double bounded_refine(int max_iterations = 1000000,
                          const FixedSet& fix = {Param::Wavelength});
    double bounded_refine_wavelength(int max_iterations = 1000000,
                                     const FixedSet& fix = {Param::Wavelength});
    double simplex_refine(int max_iterations = 1000000);
    double anneal_refine(int max_iterations = 1000000);
    double external_tool_refine(ExternalRefiner& tool);

    /* ---- χ² (unweighted) -------------------------------------------- */
    double chi2() const;
    double chi2(const Vector& p) const;
    double chi2_wavelength() const;
    double chi2_wavelength(const Vector& p) const;

    /* poni1 / poni2 from the centroid of the innermost ring */
    void guess_poni();

    /* percentage window around the current pose, see BoundsState */
    void set_tolerance(double value = 10.0);

    const PoseParameters& pose() const { return pose_; }
    void                  set_pose(const PoseParameters& pose);

    /* last evaluated parameter vector (6 or 7 entries) */
    const Vector& param() const { return param_; }

    const BoundsState& bounds() const { return bounds_; }
    BoundsState&       bounds()       { return bounds_; }

    const RefinementOptions& options() const { return options_; }
    RefinementOptions&       options()       { return options_; }

    /* residuals at the current wavelength */
    RingResiduals residuals() const;

    /* ---- named bound accessors -------------------------------------- */
#define PONIFIT_BOUND_ACCESSORS(name, param)                                         \
    double name##_min() const { return bounds_.min(param); }                         \
    double name##_max() const { return bounds_.max(param); }                         \
    template<typename T> void set_##name##_min(T value) { bounds_.set_min(param, value); } \
    template<typename T> void set_##name##_max(T value) { bounds_.set_max(param, value); }

    PONIFIT_BOUND_ACCESSORS(dist,       Param::Dist)
    PONIFIT_BOUND_ACCESSORS(poni1,      Param::Poni1)
    PONIFIT_BOUND_ACCESSORS(poni2,      Param::Poni2)
    PONIFIT_BOUND_ACCESSORS(rot1,       Param::Rot1)
    PONIFIT_BOUND_ACCESSORS(rot2,       Param::Rot2)
    PONIFIT_BOUND_ACCESSORS(rot3,       Param::Rot3)
    PONIFIT_BOUND_ACCESSORS(wavelength, Param::Wavelength)

#undef PONIFIT_BOUND_ACCESSORS

private:
    /* keep `candidate` if it beats the snapshot in param_ */
    double commit_if_improved(const char* label, const Vector& candidate);

    const CalibrationDataset& dataset_;
    const GeometryModel&      geometry_;
    PoseParameters            pose_;
    BoundsState               bounds_;
    Vector                    param_;
    RefinementOptions         options_;
};

} // namespace ponifit
