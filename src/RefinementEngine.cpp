#include "ponifit/RefinementEngine.hpp"
#include "ponifit/Strategies.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ponifit {

RefinementEngine::RefinementEngine(const CalibrationDataset& dataset,
                                   const GeometryModel&      geometry,
                                   const PoseParameters&     initial,
                                   RefinementOptions         options)
    : dataset_(dataset)
    , geometry_(geometry)
    , pose_(initial)
    , bounds_(BoundsState::defaults(geometry.pixel1(), geometry.pixel2()))
    , param_(initial.to_vector6())
    , options_(std::move(options))
{}

RingResiduals RefinementEngine::residuals() const
{
    return RingResiduals(dataset_, geometry_, pose_.wavelength);
}

void RefinementEngine::set_pose(const PoseParameters& pose)
{
    pose_  = pose;
    param_ = pose_.to_vector6();
}

void RefinementEngine::guess_poni()
{
    const auto centre = dataset_.guess_initial_center(geometry_);
    pose_.poni1 = centre.first;
    pose_.poni2 = centre.second;
    if (options_.verbose)
        std::cout << "[Refine] initial poni guess " << pose_.poni1
                  << ", " << pose_.poni2 << "\n";
}

void RefinementEngine::set_tolerance(double value)
{
    bounds_.set_tolerance(pose_, value);
}

/* ===================================================================== */
/*  χ²                                                                    */
/* ===================================================================== */
double RefinementEngine::chi2() const
{
    return chi2(param_);
}

double RefinementEngine::chi2(const Vector& p) const
{
    return residuals().sum_squares(p);
}

double RefinementEngine::chi2_wavelength() const
{
    return chi2_wavelength(param_);
}

double RefinementEngine::chi2_wavelength(const Vector& p) const
{
    if (p.size() == kNPoseParams) {
        Vector full(kNParams);
        full << p, pose_.wavelength * kWavelengthScale;
        return residuals().sum_squares_wavelength(full);
    }
    return residuals().sum_squares_wavelength(p);
}

/* ===================================================================== */
/*  commit rule                                                           */
/* ===================================================================== */
double RefinementEngine::commit_if_improved(const char* label, const Vector& candidate)
{
    const bool with_wavelength = candidate.size() == kNParams;
    if (param_.size() != candidate.size())
        throw std::logic_error("commit_if_improved: snapshot and candidate differ in size");

    const double old_chi2 = with_wavelength ? chi2_wavelength(param_) : chi2(param_);
    const double new_chi2 = with_wavelength ? chi2_wavelength(candidate) : chi2(candidate);

    std::cout << "[Refine] " << label << ": " << std::setprecision(10)
              << old_chi2 << " --> " << new_chi2 << "\n";

    if (!(new_chi2 < old_chi2))
        return old_chi2;

    Eigen::Index imax = 0;
    (param_ - candidate).cwiseAbs().maxCoeff(&imax);
    std::cout << "[Refine] maxdelta on " << param_name(static_cast<Param>(imax))
              << ": " << param_[imax] << " --> " << candidate[imax] << "\n";

    const double wavelength = pose_.wavelength;
    const bool   same_wl    = with_wavelength && candidate[6] == param_[6];

    pose_.assign(candidate);
    if (same_wl) pose_.wavelength = wavelength;   // no ÷1e10 round-off
    param_ = candidate;
    return new_chi2;
}

/* ===================================================================== */
/*  strategies                                                            */
/* ===================================================================== */
double RefinementEngine::gradient_refine()
{
    param_ = pose_.to_vector6();

    LMSolverOptions opt = options_.least_squares;
    opt.verbose = opt.verbose || options_.verbose;

    LMSolverSummary summ;
    const Vector candidate = propose_least_squares(residuals(), pose_, opt, &summ);

    if (options_.verbose) {
        std::cout << "[LM] " << summ.iterations << " iterations, converged="
                  << std::boolalpha << summ.converged << std::noboolalpha << "\n";
        for (int i = 0; i < kNPoseParams && i < static_cast<int>(summ.param_uncertainties.size()); ++i)
            std::cout << "[LM]   " << std::setw(6) << param_name(static_cast<Param>(i))
                      << " = " << candidate[i] << " +/- " << summ.param_uncertainties[i] << "\n";
    }
    return commit_if_improved("gradient", candidate);
}

double RefinementEngine::bounded_refine(int max_iterations, const FixedSet& fix)
{
    if (!fix.count(Param::Wavelength))
        return bounded_refine_wavelength(max_iterations, fix);

    param_ = pose_.to_vector6();
    const Vector candidate = propose_bounded(residuals(), pose_, bounds_, fix,
                                             false, max_iterations, options_.verbose);
    return commit_if_improved("bounded", candidate);
}

double RefinementEngine::bounded_refine_wavelength(int max_iterations, const FixedSet& fix)
{
    param_ = pose_.to_vector7();
    const Vector candidate = propose_bounded(residuals(), pose_, bounds_, fix,
                                             true, max_iterations, options_.verbose);
    return commit_if_improved("bounded+wavelength", candidate);
}

double RefinementEngine::simplex_refine(int max_iterations)
{
    param_ = pose_.to_vector6();
    const Vector candidate = propose_simplex(residuals(), pose_, max_iterations,
                                             options_.simplex_xtol, options_.verbose);
    return commit_if_improved("simplex", candidate);
}

double RefinementEngine::anneal_refine(int max_iterations)
{
    param_ = pose_.to_vector6();

    AnnealOptions opt   = options_.anneal;
    opt.max_iterations  = max_iterations;
    opt.verbose         = opt.verbose || options_.verbose;

    const Vector candidate = propose_anneal(residuals(), pose_, bounds_, opt);
    return commit_if_improved("anneal", candidate);
}

double RefinementEngine::external_tool_refine(ExternalRefiner& tool)
{
    param_ = pose_.to_vector6();
    const PoseParameters proposed = tool.refine(pose_, dataset_, geometry_);
    return commit_if_improved("external", proposed.to_vector6());
}

} // namespace ponifit
