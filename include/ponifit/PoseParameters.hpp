#pragma once
/*
 * Detector pose as seen by the refinement engine.
 *
 *  Parameter order (also the layout of every optimiser vector):
 *      0 dist    1 poni1   2 poni2
 *      3 rot1    4 rot2    5 rot3    6 wavelength
 *
 * The 6-vector carries the pose only.  The 7-vector appends the wavelength
 * multiplied by 1e10 (values of order 0.1 … 10) so that finite differences
 * and tolerances behave; it is converted back to metres on commit.
 */

#include "Types.hpp"
#include <array>
#include <set>
#include <string>
#include <vector>

namespace ponifit {

enum class Param : int {
    Dist = 0, Poni1, Poni2, Rot1, Rot2, Rot3, Wavelength
};

constexpr int    kNPoseParams       = 6;
constexpr int    kNParams           = 7;
constexpr double kWavelengthScale   = 1e10;   // metres -> optimiser units

const char* param_name(Param p);
Param       param_from_name(const std::string& name);

inline int index_of(Param p) { return static_cast<int>(p); }

using FixedSet = std::set<Param>;

struct PoseParameters {
    double dist       = 1.0;     // m
    double poni1      = 0.0;     // m
    double poni2      = 0.0;     // m
    double rot1       = 0.0;     // rad
    double rot2       = 0.0;     // rad
    double rot3       = 0.0;     // rad
    double wavelength = 1e-10;   // m

    double  get(Param p) const;
    double& get(Param p);

    /* dist … rot3 */
    Vector to_vector6() const;
    /* dist … rot3 , wavelength·1e10 */
    Vector to_vector7() const;

    /* copy pose (and for size 7 the rescaled wavelength) out of a vector */
    void assign(const Vector& v);
};

struct Bound {
    double min;
    double max;
};

/*
 * Independent (min, max) pair for every parameter.  min ≤ max is *not*
 * enforced; optimisers receiving inverted pairs produce undefined results
 * which the accept-if-improved rule then filters.
 */
class BoundsState {
public:
    BoundsState() = default;

    /* physically loose defaults, poni window expressed in pixels */
    static BoundsState defaults(double pixel1, double pixel2);

    const Bound& operator[](Param p) const { return b_[index_of(p)]; }

    double min(Param p) const { return b_[index_of(p)].min; }
    double max(Param p) const { return b_[index_of(p)].max; }

    template<typename T>
    void set_min(Param p, T value) { b_[index_of(p)].min = static_cast<double>(value); }
    template<typename T>
    void set_max(Param p, T value) { b_[index_of(p)].max = static_cast<double>(value); }

    /*  Percentage window around the current pose.
     *
     *  dist and wavelength:  [(1-v/100)·x , (1+v/100)·x]
     *  poni / rot:           ordered pair of the same products, unless
     *                        |x| ≤ (v/100)²  in which case the window is
     *                        ±(v/100)²  (quadratic in v, kept as is).
     */
    void set_tolerance(const PoseParameters& pose, double value = 10.0);

    /*  lower / upper vectors for the first n parameters; every parameter
     *  in `fix` is collapsed onto its current value.  For n == 7 the       *
     *  wavelength entry is expressed in optimiser units (×1e10).           */
    void collapsed(const PoseParameters&  pose,
                   const FixedSet&        fix,
                   int                    n,
                   std::vector<double>&   lower,
                   std::vector<double>&   upper) const;

private:
    std::array<Bound, kNParams> b_{};
};

} // namespace ponifit
