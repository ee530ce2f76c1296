#include "ponifit/PoseParameters.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ponifit {

namespace {

const char* kNames[kNParams] =
    { "dist", "poni1", "poni2", "rot1", "rot2", "rot3", "wavelength" };

} // unnamed namespace

const char* param_name(Param p)
{
    return kNames[index_of(p)];
}

Param param_from_name(const std::string& name)
{
    for (int i = 0; i < kNParams; ++i)
        if (name == kNames[i]) return static_cast<Param>(i);
    throw std::invalid_argument("Unknown geometry parameter '" + name + "'");
}

double PoseParameters::get(Param p) const
{
    switch (p) {
        case Param::Dist:       return dist;
        case Param::Poni1:      return poni1;
        case Param::Poni2:      return poni2;
        case Param::Rot1:       return rot1;
        case Param::Rot2:       return rot2;
        case Param::Rot3:       return rot3;
        case Param::Wavelength: return wavelength;
    }
    throw std::out_of_range("PoseParameters::get: bad parameter");
}

double& PoseParameters::get(Param p)
{
    switch (p) {
        case Param::Dist:       return dist;
        case Param::Poni1:      return poni1;
        case Param::Poni2:      return poni2;
        case Param::Rot1:       return rot1;
        case Param::Rot2:       return rot2;
        case Param::Rot3:       return rot3;
        case Param::Wavelength: return wavelength;
    }
    throw std::out_of_range("PoseParameters::get: bad parameter");
}

Vector PoseParameters::to_vector6() const
{
    Vector v(kNPoseParams);
    v << dist, poni1, poni2, rot1, rot2, rot3;
    return v;
}

Vector PoseParameters::to_vector7() const
{
    Vector v(kNParams);
    v << dist, poni1, poni2, rot1, rot2, rot3, wavelength * kWavelengthScale;
    return v;
}

void PoseParameters::assign(const Vector& v)
{
    if (v.size() != kNPoseParams && v.size() != kNParams)
        throw std::invalid_argument("PoseParameters::assign: expected 6 or 7 values, got " +
                                    std::to_string(v.size()));
    dist  = v[0];
    poni1 = v[1];
    poni2 = v[2];
    rot1  = v[3];
    rot2  = v[4];
    rot3  = v[5];
    if (v.size() == kNParams)
        wavelength = v[6] / kWavelengthScale;
}

/* ------------------------------------------------------------------------- */
/*  bounds                                                                   */
/* ------------------------------------------------------------------------- */
BoundsState BoundsState::defaults(double pixel1, double pixel2)
{
    const double pi = std::acos(-1.0);

    BoundsState b;
    b.b_[index_of(Param::Dist)]       = { 0.0, 10.0 };
    b.b_[index_of(Param::Poni1)]      = { -10000.0 * pixel1, 15000.0 * pixel1 };
    b.b_[index_of(Param::Poni2)]      = { -10000.0 * pixel2, 15000.0 * pixel2 };
    b.b_[index_of(Param::Rot1)]       = { -pi, pi };
    b.b_[index_of(Param::Rot2)]       = { -pi, pi };
    b.b_[index_of(Param::Rot3)]       = { -pi, pi };
    b.b_[index_of(Param::Wavelength)] = { 1e-15, 100.0e-10 };
    return b;
}

void BoundsState::set_tolerance(const PoseParameters& pose, double value)
{
    const double frac = value / 100.0;
    const double low  = 1.0 - frac;
    const double hi   = 1.0 + frac;
    const double zero_window = frac * frac;

    b_[index_of(Param::Dist)] = { low * pose.dist, hi * pose.dist };

    for (Param p : { Param::Poni1, Param::Poni2,
                     Param::Rot1,  Param::Rot2, Param::Rot3 })
    {
        const double x = pose.get(p);
        if (std::abs(x) > zero_window) {
            b_[index_of(p)] = { std::min(low * x, hi * x),
                                std::max(low * x, hi * x) };
        } else {
            b_[index_of(p)] = { -zero_window, zero_window };
        }
    }

    b_[index_of(Param::Wavelength)] = { low * pose.wavelength,
                                        hi  * pose.wavelength };
}

void BoundsState::collapsed(const PoseParameters&  pose,
                            const FixedSet&        fix,
                            int                    n,
                            std::vector<double>&   lower,
                            std::vector<double>&   upper) const
{
    lower.resize(n);
    upper.resize(n);
    for (int i = 0; i < n; ++i) {
        const Param p = static_cast<Param>(i);
        if (fix.count(p)) {
            lower[i] = upper[i] = pose.get(p);
        } else {
            lower[i] = b_[i].min;
            upper[i] = b_[i].max;
        }
        if (p == Param::Wavelength) {
            lower[i] *= kWavelengthScale;
            upper[i] *= kWavelengthScale;
        }
    }
}

} // namespace ponifit
