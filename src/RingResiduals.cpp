#include "ponifit/RingResiduals.hpp"
#include "ponifit/Errors.hpp"
#include "ponifit/PoseParameters.hpp"
#include <cmath>
#include <stdexcept>

namespace ponifit {

double reference_angle(const std::vector<double>& d_spacing,
                       int                        ring,
                       double                     wavelength)
{
    if (ring < 0 || static_cast<std::size_t>(ring) >= d_spacing.size())
        throw RingIndexError(ring, d_spacing.size());
    return 2.0 * std::asin(wavelength / (2.0e-10 * d_spacing[ring]));
}

RingResiduals::RingResiduals(const CalibrationDataset& dataset,
                             const GeometryModel&      geometry,
                             double                    wavelength)
    : dataset_(dataset)
    , geometry_(geometry)
    , wavelength_(wavelength)
    , d1_(dataset.pixel1())
    , d2_(dataset.pixel2())
    , rings_(dataset.rings())
    , weights_(dataset.weights())
{}

/* --------------------------------------------------------------------- */
/*  (1)  residual vectors                                                */
/* --------------------------------------------------------------------- */
Vector RingResiduals::compute(const Vector& p, double wavelength) const
{
    const auto& d_spacing = dataset_.d_spacing();

    Vector r(d1_.size());
    for (Eigen::Index i = 0; i < d1_.size(); ++i) {
        r[i] = geometry_.tth(d1_[i], d2_[i], p)
             - reference_angle(d_spacing, rings_[i], wavelength);
    }
    return r;
}

Vector RingResiduals::residual_vector(const Vector& p) const
{
    return compute(p, wavelength_);
}

Vector RingResiduals::residual_vector_wavelength(const Vector& p) const
{
    if (p.size() < kNParams)
        throw std::invalid_argument("residual_vector_wavelength: need 7 parameters, got " +
                                    std::to_string(p.size()));
    return compute(p, p[6] / kWavelengthScale);
}

Vector RingResiduals::dispatch(const Vector& p) const
{
    return p.size() == kNParams ? residual_vector_wavelength(p)
                                : residual_vector(p);
}

/* --------------------------------------------------------------------- */
/*  (2)  scalar objectives                                               */
/* --------------------------------------------------------------------- */
double RingResiduals::sum_squares(const Vector& p) const
{
    return residual_vector(p).squaredNorm();
}

double RingResiduals::sum_squares_weighted(const Vector& p) const
{
    return (weights_.array() * residual_vector(p).array().square()).sum();
}

double RingResiduals::sum_squares_wavelength(const Vector& p) const
{
    return residual_vector_wavelength(p).squaredNorm();
}

double RingResiduals::sum_squares_wavelength_weighted(const Vector& p) const
{
    return (weights_.array() * residual_vector_wavelength(p).array().square()).sum();
}

double RingResiduals::objective(const Vector& p) const
{
    const bool with_wavelength = p.size() == kNParams;
    if (dataset_.has_weights())
        return with_wavelength ? sum_squares_wavelength_weighted(p)
                               : sum_squares_weighted(p);
    return with_wavelength ? sum_squares_wavelength(p) : sum_squares(p);
}

/* --------------------------------------------------------------------- */
/*  (3)  residuals + Jacobian                                            */
/* --------------------------------------------------------------------- */
void RingResiduals::operator()(const Eigen::VectorXd& parameters,
                               Eigen::VectorXd*       residuals,
                               Eigen::MatrixXd*       jacobians) const
{
    const Vector r0 = dispatch(parameters);
    if (residuals) *residuals = r0;

    if (!jacobians) return;                       // caller wants resid only
    jacobians->resize(r0.size(), parameters.size());

    const double eps_base = 1e-6;
    for (Eigen::Index j = 0; j < parameters.size(); ++j)
    {
        const double h = eps_base * (std::abs(parameters[j]) + 1.0);
        Eigen::VectorXd p_eps = parameters;
        p_eps[j] += h;

        jacobians->col(j) = (dispatch(p_eps) - r0) / h;
    }
}

} // namespace ponifit
