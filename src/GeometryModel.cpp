#include "ponifit/GeometryModel.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace ponifit {

Vector GeometryModel::tth(const Vector& d1, const Vector& d2,
                          const Vector& params) const
{
    if (d1.size() != d2.size())
        throw std::invalid_argument("tth: d1 / d2 length mismatch.");

    Vector out(d1.size());
    for (Eigen::Index i = 0; i < d1.size(); ++i)
        out[i] = tth(d1[i], d2[i], params);
    return out;
}

std::pair<Vector, Vector>
GeometryModel::calc_cartesian_positions(const Vector& d1, const Vector& d2) const
{
    if (d1.size() != d2.size())
        throw std::invalid_argument("calc_cartesian_positions: d1 / d2 length mismatch.");

    Vector p1(d1.size()), p2(d2.size());
    for (Eigen::Index i = 0; i < d1.size(); ++i) {
        const auto pos = calc_cartesian_positions(d1[i], d2[i]);
        p1[i] = pos.first;
        p2[i] = pos.second;
    }
    return { p1, p2 };
}

/* ------------------------------------------------------------------------- */
FlatDetectorGeometry::FlatDetectorGeometry(double pixel1, double pixel2)
    : pixel1_(pixel1), pixel2_(pixel2)
{
    if (!(pixel1 > 0.0) || !(pixel2 > 0.0))
        throw std::invalid_argument("FlatDetectorGeometry: pixel sizes must be positive (got " +
                                    std::to_string(pixel1) + ", " +
                                    std::to_string(pixel2) + ")");
}

std::pair<double, double>
FlatDetectorGeometry::calc_cartesian_positions(double d1, double d2) const
{
    return { pixel1_ * (d1 + 0.5), pixel2_ * (d2 + 0.5) };
}

double FlatDetectorGeometry::tth(double d1, double d2, const Vector& param) const
{
    if (param.size() < 6)
        throw std::invalid_argument("FlatDetectorGeometry::tth: need at least 6 parameters");

    const double L  = param[0];
    const auto  pos = calc_cartesian_positions(d1, d2);
    const double p1 = pos.first  - param[1];
    const double p2 = pos.second - param[2];

    const double c1 = std::cos(param[3]), s1 = std::sin(param[3]);
    const double c2 = std::cos(param[4]), s2 = std::sin(param[4]);
    const double c3 = std::cos(param[5]), s3 = std::sin(param[5]);

    const double t1 = p1 * c2 * c3
                    + p2 * (c3 * s1 * s2 - c1 * s3)
                    - L  * (c1 * c3 * s2 + s1 * s3);
    const double t2 = p1 * c2 * s3
                    + p2 * (c1 * c3 + s1 * s2 * s3)
                    - L  * (-(c3 * s1) + c1 * s2 * s3);
    const double t3 = p1 * s2
                    - p2 * c2 * s1
                    + L  * c1 * c2;

    return std::atan2(std::sqrt(t1 * t1 + t2 * t2), t3);
}

} // namespace ponifit
