#include <catch2/catch.hpp>
#include "ponifit/GeometryModel.hpp"
#include "ponifit/RefinementEngine.hpp"
#include "SyntheticRing.hpp"
#include <cmath>
#include <functional>

using namespace ponifit;
using namespace ponifit_test;

namespace {

/* stands in for the legacy tool: proposes whatever the test hands it */
class FixedProposal : public ExternalRefiner {
public:
    explicit FixedProposal(std::function<PoseParameters(const PoseParameters&)> f)
        : f_(std::move(f)) {}

    PoseParameters refine(const PoseParameters& pose,
                          const CalibrationDataset&,
                          const GeometryModel&) override
    {
        ++calls;
        return f_(pose);
    }

    int calls = 0;

private:
    std::function<PoseParameters(const PoseParameters&)> f_;
};

bool identical(const PoseParameters& a, const PoseParameters& b)
{
    return a.dist == b.dist && a.poni1 == b.poni1 && a.poni2 == b.poni2 &&
           a.rot1 == b.rot1 && a.rot2 == b.rot2 && a.rot3 == b.rot3 &&
           a.wavelength == b.wavelength;
}

/*  One observation whose d-spacing and wavelength are nudged by single ulps
 *  until its residual is exactly zero in both the 6- and the 7-parameter
 *  form.  Nothing can go below χ² = 0.                                    */
struct ExactOptimum {
    CalibrationDataset dataset;
    PoseParameters     pose;
    bool               found = false;
};

ExactOptimum exact_optimum(const GeometryModel& geo)
{
    ExactOptimum res;
    res.pose = true_pose();

    const double radius = 0.02;
    const double tth    = std::atan(radius / res.pose.dist);
    const std::vector<double> row = { (res.pose.poni1 + radius) / kPixel - 0.5,
                                      res.pose.poni2 / kPixel - 0.5, 0.0 };

    double d = res.pose.wavelength / (2.0e-10 * std::sin(tth / 2.0));
    for (int i = 0; i < 32; ++i) d = std::nextafter(d, 0.0);

    for (int i = 0; i < 64 && !res.found; ++i, d = std::nextafter(d, 1e3)) {
        res.dataset = CalibrationDataset::from_rows({ row }, { d });
        double wl = true_pose().wavelength;
        for (int k = 0; k < 32; ++k) wl = std::nextafter(wl, 0.0);
        for (int j = 0; j < 64 && !res.found; ++j, wl = std::nextafter(wl, 1.0)) {
            PoseParameters p = res.pose;
            p.wavelength = wl;
            const RefinementEngine trial(res.dataset, geo, p);
            if (trial.chi2() == 0.0 && trial.chi2_wavelength() == 0.0) {
                res.pose  = p;
                res.found = true;
            }
        }
    }
    return res;
}

} // namespace

TEST_CASE("Gradient refinement recovers a perturbed pose", "[engine]") {
    const auto ds = ring_dataset(4);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, perturbed_pose());

    const double before = engine.chi2();
    REQUIRE(before > 1e-6);

    const double after = engine.gradient_refine();
    CHECK(after < 1e-6);
    CHECK(after < before);
    CHECK(engine.chi2() == after);
    CHECK(engine.chi2(engine.pose().to_vector6()) == Approx(after).margin(1e-15));
}

TEST_CASE("Every strategy is a no-op at zero iterations", "[engine]") {
    const auto ds = ring_dataset(4);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    RefinementOptions opt;
    opt.least_squares.max_iterations = 0;
    RefinementEngine engine(ds, geo, perturbed_pose(), opt);

    const PoseParameters start = engine.pose();
    const double c0 = engine.chi2();

    CHECK(engine.gradient_refine() == c0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.bounded_refine(0) == c0);
    CHECK(identical(engine.pose(), start));

    engine.bounded_refine_wavelength(0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.simplex_refine(0) == c0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.anneal_refine(0) == c0);
    CHECK(identical(engine.pose(), start));

    FixedProposal same([](const PoseParameters& p) { return p; });
    CHECK(engine.external_tool_refine(same) == c0);
    CHECK(identical(engine.pose(), start));
    CHECK(same.calls == 1);
}

TEST_CASE("Strategies leave an exact optimum bit-identical", "[engine]") {
    const FlatDetectorGeometry geo(kPixel, kPixel);
    const ExactOptimum opt = exact_optimum(geo);
    REQUIRE(opt.found);

    RefinementEngine engine(opt.dataset, geo, opt.pose);
    const PoseParameters start = engine.pose();
    REQUIRE(engine.chi2() == 0.0);

    CHECK(engine.gradient_refine() == 0.0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.bounded_refine() == 0.0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.bounded_refine_wavelength() == 0.0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.bounded_refine(1000000, {}) == 0.0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.simplex_refine() == 0.0);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.anneal_refine() == 0.0);
    CHECK(identical(engine.pose(), start));

    FixedProposal same([](const PoseParameters& p) { return p; });
    CHECK(engine.external_tool_refine(same) == 0.0);
    CHECK(identical(engine.pose(), start));
}

TEST_CASE("Fully fixed bounded refinement changes nothing", "[engine]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, perturbed_pose());

    const PoseParameters start = engine.pose();
    const double c6 = engine.chi2();
    const double c7 = engine.chi2_wavelength(engine.pose().to_vector7());

    const FixedSet everything = { Param::Dist, Param::Poni1, Param::Poni2, Param::Rot1,
                                 Param::Rot2, Param::Rot3, Param::Wavelength };
    CHECK(engine.bounded_refine(1000000, everything) == c6);
    CHECK(identical(engine.pose(), start));

    CHECK(engine.bounded_refine_wavelength(1000000, everything) == c7);
    CHECK(identical(engine.pose(), start));
}

TEST_CASE("Bounded wavelength refinement fixes the wavelength by default", "[engine][wavelength]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    PoseParameters start = perturbed_pose();
    start.wavelength = 1.01e-10;
    RefinementEngine engine(ds, geo, start);
    engine.set_tolerance(10);

    const double before = engine.chi2_wavelength();
    const double after  = engine.bounded_refine_wavelength(200);
    CHECK(after < before);
    CHECK(engine.pose().wavelength == 1.01e-10);
    CHECK(engine.param().size() == 7);
}

TEST_CASE("Simplex and annealing ignore the weight column", "[engine]") {
    const auto ring = ring_dataset(8, 0.02, 1e-10, true);
    Matrix m = ring.data();
    m.col(3).setZero();
    const CalibrationDataset ds(m, ring.d_spacing());
    const FlatDetectorGeometry geo(kPixel, kPixel);

    RefinementEngine simplex(ds, geo, perturbed_pose());
    const double s0 = simplex.chi2();
    CHECK(simplex.simplex_refine() < s0);

    RefinementEngine anneal(ds, geo, perturbed_pose());
    anneal.set_tolerance(20);
    const double a0 = anneal.chi2();
    CHECK(anneal.anneal_refine() < a0);
    CHECK_FALSE(identical(anneal.pose(), perturbed_pose()));
}

TEST_CASE("A worse candidate is never committed", "[engine]") {
    const auto ds = ring_dataset(4);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, true_pose());

    const PoseParameters start = engine.pose();
    const double c0 = engine.chi2();

    FixedProposal worse([](PoseParameters p) { p.dist *= 1.5; return p; });
    CHECK(engine.external_tool_refine(worse) == c0);
    CHECK(identical(engine.pose(), start));

    FixedProposal better([](PoseParameters p) { p.dist = 0.1; return p; });
    RefinementEngine off(ds, geo, [] { auto p = true_pose(); p.dist = 0.11; return p; }());
    const double off0 = off.chi2();
    CHECK(off.external_tool_refine(better) < off0);
    CHECK(off.pose().dist == 0.1);
}

TEST_CASE("Strategies never increase chi2", "[engine]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    RefinementEngine engine(ds, geo, perturbed_pose());
    engine.set_tolerance(20);

    double prev = engine.chi2();
    auto step = [&](double c2) {
        CHECK(c2 <= Approx(prev));
        CHECK(c2 == Approx(engine.chi2()));
        prev = c2;
    };

    step(engine.anneal_refine(20));
    step(engine.bounded_refine(200));
    step(engine.simplex_refine());
    step(engine.gradient_refine());
    step(engine.bounded_refine_wavelength(200));

    CHECK(prev < 1e-6);
}

TEST_CASE("Bounded refinement keeps fixed parameters and bounds", "[engine]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, perturbed_pose());
    engine.set_dist_min(0.104);
    engine.set_dist_max(0.2);

    engine.bounded_refine(500, { Param::Wavelength, Param::Rot3, Param::Poni2 });
    CHECK(engine.pose().rot3 == 0.0);
    CHECK(engine.pose().poni2 == perturbed_pose().poni2);
    CHECK(engine.pose().dist >= 0.104);
    CHECK(engine.pose().wavelength == perturbed_pose().wavelength);
    CHECK(engine.param().size() == 6);
}

TEST_CASE("Fixed wavelength survives the scaled round trip exactly", "[engine][wavelength]") {
    const double lambda0 = 1.2345678912345e-10;
    const auto ds = ring_dataset(8, 0.02, lambda0);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, perturbed_pose(lambda0));

    const double before = engine.chi2_wavelength();
    const double after  = engine.bounded_refine_wavelength(500, { Param::Wavelength });
    CHECK(after < before);
    CHECK(engine.pose().wavelength == lambda0);
    CHECK(engine.param().size() == 7);
}

TEST_CASE("Bounded refinement without a fixed wavelength refines it", "[engine][wavelength]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    PoseParameters start = true_pose();
    start.wavelength = 1.02e-10;
    RefinementEngine engine(ds, geo, start);
    engine.set_tolerance(10);

    const double before = engine.chi2_wavelength();
    const double after  = engine.bounded_refine(2000, { Param::Dist, Param::Poni1, Param::Poni2,
                                                        Param::Rot1, Param::Rot2, Param::Rot3 });
    CHECK(engine.param().size() == 7);
    CHECK(after < before);
    CHECK(engine.pose().wavelength == Approx(1e-10).epsilon(1e-4));
    CHECK(engine.pose().dist == 0.1);
}

TEST_CASE("chi2_wavelength appends the current wavelength", "[engine][wavelength]") {
    const auto ds = ring_dataset(4);
    const FlatDetectorGeometry geo(kPixel, kPixel);
    RefinementEngine engine(ds, geo, perturbed_pose());

    CHECK(engine.param().size() == 6);
    CHECK(engine.chi2_wavelength() == Approx(engine.chi2()));
    CHECK(engine.chi2_wavelength(engine.pose().to_vector7()) == Approx(engine.chi2()));
}

TEST_CASE("Poni guess and tolerance window", "[engine]") {
    const auto ds = ring_dataset(8);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    PoseParameters start;
    start.dist = 0.1;
    RefinementEngine engine(ds, geo, start);
    engine.guess_poni();
    CHECK(engine.pose().poni1 == Approx(0.05));
    CHECK(engine.pose().poni2 == Approx(0.05));

    engine.set_tolerance(10);
    CHECK(engine.poni1_min() == Approx(0.045));
    CHECK(engine.poni1_max() == Approx(0.055));
    CHECK(engine.rot1_min() == Approx(-0.01));
    CHECK(engine.dist_max() == Approx(0.11));
}
