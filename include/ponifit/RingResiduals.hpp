#pragma once
#include "Types.hpp"
#include "CalibrationDataset.hpp"
#include "GeometryModel.hpp"
#include <vector>

namespace ponifit {

/*  2θ of a reference ring:  2·asin( λ / (2e-10·d) ),  d in Å, λ in m.
 *  Throws RingIndexError when `ring` has no d-spacing entry.  λ > 2d
 *  yields NaN; this happens while optimisers wander and is not trapped.   */
double reference_angle(const std::vector<double>& d_spacing,
                       int                        ring,
                       double                     wavelength);

/* ------------------------------------------------------------------------- */
/*  Residuals of all observations at once                                    */
/*                                                                           */
/*  r_i = tth(d1_i, d2_i, p) − 2θ_ref(ring_i, λ)                             */
/*                                                                           */
/*  A 6-vector p uses the fixed wavelength given at construction; a          */
/*  7-vector carries λ·1e10 in p[6] and the residual uses p[6]·1e-10.        */
/* ------------------------------------------------------------------------- */
class RingResiduals {
public:
    RingResiduals(const CalibrationDataset& dataset,
                  const GeometryModel&      geometry,
                  double                    wavelength);

    int numResiduals() const { return static_cast<int>(d1_.size()); }

    Vector residual_vector(const Vector& p) const;             // fixed λ
    Vector residual_vector_wavelength(const Vector& p) const;  // λ = p[6]·1e-10

    double sum_squares(const Vector& p) const;
    double sum_squares_weighted(const Vector& p) const;
    double sum_squares_wavelength(const Vector& p) const;
    double sum_squares_wavelength_weighted(const Vector& p) const;

    /*  scalar objective picked from the data layout: weighted when the
     *  dataset has a weight column, wavelength variant for 7-vectors       */
    double objective(const Vector& p) const;

    /* LM entry: residuals and (optionally) forward-difference Jacobian */
    void operator()(const Eigen::VectorXd& parameters,
                    Eigen::VectorXd*       residuals,
                    Eigen::MatrixXd*       jacobians) const;

private:
    Vector compute(const Vector& p, double wavelength) const;
    Vector dispatch(const Vector& p) const;

    const CalibrationDataset& dataset_;
    const GeometryModel&      geometry_;
    double                    wavelength_;

    Vector           d1_;
    Vector           d2_;
    std::vector<int> rings_;
    Vector           weights_;
};

} // namespace ponifit
