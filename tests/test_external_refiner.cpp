#include <catch2/catch.hpp>
#include "ponifit/Errors.hpp"
#include "ponifit/ExternalRefiner.hpp"
#include "ponifit/GeometryModel.hpp"
#include "ponifit/RefinementEngine.hpp"
#include "SyntheticRing.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ponifit;
using namespace ponifit_test;
namespace fs = std::filesystem;

namespace {

/* shell script standing in for the legacy executable */
class FakeTool {
public:
    FakeTool(const std::string& name, const std::string& body)
        : file_(name, "#!/bin/sh\n" + body)
    {
        fs::permissions(file_.path(),
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
    }
    const std::string& path() const { return file_.path(); }

private:
    ScratchFile file_;
};

} // namespace

TEST_CASE("Tool output updates only the reported values", "[external]") {
    PoseParameters start = perturbed_pose();
    start.rot1 = 0.01;

    std::istringstream out(
        "roca v2 -- refining\n"
        "cen1 12.5 px\n"
        "iteration 3 of 10 done\n"
        "cen2 7.0 px\n"
        "cen1 only\n"
        "dis 0.3 m extra\n");

    const ToolReport rep = parse_tool_report(out, start, 1e-4, 2e-4);
    CHECK(rep.recognised == 2);
    CHECK(rep.pose.poni1 == Approx(12.5e-4));
    CHECK(rep.pose.poni2 == Approx(14e-4));
    CHECK(rep.pose.dist == start.dist);
    CHECK(rep.pose.rot1 == start.rot1);
    CHECK(rep.pose.wavelength == start.wavelength);
}

TEST_CASE("Distance and rotations are taken as reported", "[external]") {
    std::istringstream out("dis 0.2 m\nrot1 0.1 rad\nrot2 -0.2 rad\nrot3 0.3 rad\n");
    const ToolReport rep = parse_tool_report(out, PoseParameters{}, 1e-4, 1e-4);
    CHECK(rep.recognised == 4);
    CHECK(rep.pose.dist == 0.2);
    CHECK(rep.pose.rot2 == -0.2);
    CHECK(rep.pose.rot3 == 0.3);
}

TEST_CASE("Malformed value of a known key is an error", "[external]") {
    std::istringstream out("cen1 twelve px\n");
    CHECK_THROWS_AS(parse_tool_report(out, PoseParameters{}, 1e-4, 1e-4), ExternalToolError);

    std::istringstream trailing("dis 0.2x m\n");
    CHECK_THROWS_AS(parse_tool_report(trailing, PoseParameters{}, 1e-4, 1e-4), ExternalToolError);
}

TEST_CASE("Missing executable raises ExternalToolError", "[external]") {
    const auto ds = ring_dataset();
    const FlatDetectorGeometry geo(kPixel, kPixel);
    LegacyToolRefiner tool("/nonexistent/roca");
    CHECK(tool.executable() == "/nonexistent/roca");
    CHECK_THROWS_AS(tool.refine(true_pose(), ds, geo), ExternalToolError);
}

TEST_CASE("Failing or silent tools raise ExternalToolError", "[external]") {
    const auto ds = ring_dataset();
    const FlatDetectorGeometry geo(kPixel, kPixel);

    const FakeTool failing("ponifit_fake_fail.sh", "echo 'cen1 1 px'\nexit 2\n");
    LegacyToolRefiner a(failing.path());
    CHECK_THROWS_AS(a.refine(true_pose(), ds, geo), ExternalToolError);

    const FakeTool silent("ponifit_fake_silent.sh", "echo 'nothing to report'\n");
    LegacyToolRefiner b(silent.path());
    CHECK_THROWS_AS(b.refine(true_pose(), ds, geo), ExternalToolError);

    RefinementEngine engine(ds, geo, perturbed_pose());
    const PoseParameters before = engine.pose();
    CHECK_THROWS_AS(engine.external_tool_refine(b), ExternalToolError);
    CHECK(engine.pose().dist == before.dist);
    CHECK(engine.pose().poni1 == before.poni1);
}

TEST_CASE("Legacy tool sees the observations and its answer is committed", "[external][engine]") {
    const auto ds = ring_dataset(4);
    const FlatDetectorGeometry geo(kPixel, kPixel);

    const std::string seen = (fs::temp_directory_path() / "ponifit_fake_seen.txt").string();
    const FakeTool tool("ponifit_fake_roca.sh",
        "test $# -eq 11 || exit 5\n"
        "in=\"${3#input=}\"\n"
        "test -f \"$in\" || exit 3\n"
        "test $(wc -l < \"$in\") -eq 4 || exit 4\n"
        "echo \"$in\" > '" + seen + "'\n"
        "echo 'roca: 4 points read'\n"
        "echo 'cen1 500 px'\n"
        "echo 'cen2 500 px'\n"
        "echo 'dis 0.1 m'\n"
        "echo 'rot1 0 rad'\n"
        "echo 'rot2 0 rad'\n"
        "echo 'rot3 0 rad'\n");

    RefinementEngine engine(ds, geo, perturbed_pose());
    const double before = engine.chi2();

    LegacyToolRefiner roca(tool.path());
    const double after = engine.external_tool_refine(roca);
    CHECK(after < before);
    CHECK(after < 1e-20);
    CHECK(engine.pose().poni1 == Approx(0.05));
    CHECK(engine.pose().dist == 0.1);

    // the observation file is gone once the call returns
    std::ifstream f(seen);
    std::string input_path;
    REQUIRE(std::getline(f, input_path));
    CHECK_FALSE(fs::exists(input_path));
    f.close();
    fs::remove(seen);
}
