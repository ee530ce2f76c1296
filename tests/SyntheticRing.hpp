#pragma once
#include "ponifit/CalibrationDataset.hpp"
#include "ponifit/PoseParameters.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ponifit_test {

constexpr double kPixel = 1e-4;

/* untilted detector 0.1 m behind the sample, beam hitting (0.05, 0.05) m */
inline ponifit::PoseParameters true_pose(double wavelength = 1e-10)
{
    ponifit::PoseParameters p;
    p.dist       = 0.1;
    p.poni1      = 0.05;
    p.poni2      = 0.05;
    p.wavelength = wavelength;
    return p;
}

/*  n points of ring 0 at `radius` metres around the poni of true_pose(),
 *  with the d-spacing (Å) that puts that ring exactly there.             */
inline ponifit::CalibrationDataset ring_dataset(int    n          = 4,
                                                double radius     = 0.02,
                                                double wavelength = 1e-10,
                                                bool   weighted   = false)
{
    const auto   pose = true_pose(wavelength);
    const double pi   = std::acos(-1.0);

    std::vector<std::vector<double>> rows;
    for (int k = 0; k < n; ++k) {
        const double phi = 2.0 * pi * k / n;
        const double x1  = pose.poni1 + radius * std::cos(phi);
        const double x2  = pose.poni2 + radius * std::sin(phi);
        std::vector<double> row = { x1 / kPixel - 0.5, x2 / kPixel - 0.5, 0.0 };
        if (weighted) row.push_back(1.0);
        rows.push_back(row);
    }

    const double tth = std::atan(radius / pose.dist);
    const double d   = wavelength / (2.0e-10 * std::sin(tth / 2.0));
    return ponifit::CalibrationDataset::from_rows(rows, { d });
}

inline ponifit::PoseParameters perturbed_pose(double wavelength = 1e-10)
{
    auto p  = true_pose(wavelength);
    p.dist  = 0.105;
    p.poni1 = 0.0505;
    p.poni2 = 0.0495;
    return p;
}

/* file in the temp directory, removed again by the destructor */
class ScratchFile {
public:
    ScratchFile(const std::string& name, const std::string& content)
        : path_((std::filesystem::temp_directory_path() / name).string())
    {
        std::ofstream f(path_);
        f << content;
    }
    ~ScratchFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScratchFile(const ScratchFile&)            = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace ponifit_test
