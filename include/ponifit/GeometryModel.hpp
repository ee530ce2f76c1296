#pragma once
#include "Types.hpp"
#include <utility>

namespace ponifit {

/* ------------------------------------------------------------------------- */
/*  Forward model consumed by the refinement engine.                         */
/*                                                                           */
/*  `params` is a 6- or 7-vector laid out as in PoseParameters.hpp; only     */
/*  the first six entries take part in the geometry.                         */
/* ------------------------------------------------------------------------- */
class GeometryModel {
public:
    virtual ~GeometryModel() = default;

    /* scattering angle 2θ (rad) of pixel (d1, d2) */
    virtual double tth(double d1, double d2, const Vector& params) const = 0;

    /* pixel indices -> metric position on the detector plane (m) */
    virtual std::pair<double, double>
    calc_cartesian_positions(double d1, double d2) const = 0;

    virtual double pixel1() const = 0;
    virtual double pixel2() const = 0;

    /* column-wise helpers, one entry per observation */
    Vector tth(const Vector& d1, const Vector& d2, const Vector& params) const;
    std::pair<Vector, Vector>
    calc_cartesian_positions(const Vector& d1, const Vector& d2) const;
};

/* ------------------------------------------------------------------------- */
/*  Ideal flat detector without distortion.                                  */
/*                                                                           */
/*  Pixel centre  p = pixel·(d + 0.5).  Rotations: rot1 around axis 1,       */
/*  rot2 around axis 2, rot3 around the incident beam.                       */
/* ------------------------------------------------------------------------- */
class FlatDetectorGeometry : public GeometryModel {
public:
    FlatDetectorGeometry(double pixel1, double pixel2);

    double tth(double d1, double d2, const Vector& params) const override;

    std::pair<double, double>
    calc_cartesian_positions(double d1, double d2) const override;

    double pixel1() const override { return pixel1_; }
    double pixel2() const override { return pixel2_; }

    using GeometryModel::tth;
    using GeometryModel::calc_cartesian_positions;

private:
    double pixel1_;
    double pixel2_;
};

} // namespace ponifit
