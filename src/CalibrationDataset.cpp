#include "ponifit/CalibrationDataset.hpp"
#include "ponifit/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ponifit {
namespace {

void check_shape(const Matrix& m)
{
    if (m.cols() != 0 && m.cols() != 3 && m.cols() != 4)
        throw DataShapeError("Calibration data must have 3 or 4 columns, got " +
                             std::to_string(m.cols()));
}

// ----------------------------------------------------------------------------
//  Read a whitespace separated numeric table, skip comment and blank lines
// ----------------------------------------------------------------------------
std::vector<std::vector<double>>
read_ascii_rows(const std::string& path, char comment_char = '#')
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<std::vector<double>> rows;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        auto it = std::find_if_not(line.begin(), line.end(), ::isspace);
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::istringstream ss(line);
        std::vector<double> row;
        double v;
        while (ss >> v) row.push_back(v);
        if (!ss.eof())
            throw std::runtime_error("'" + path + "' line " + std::to_string(lineno) +
                                     ": not a number");
        rows.push_back(std::move(row));
    }
    return rows;
}

} // unnamed namespace

std::vector<double> load_d_spacing_file(const std::string& path)
{
    const auto rows = read_ascii_rows(path);
    std::vector<double> d;
    d.reserve(rows.size());
    for (const auto& r : rows)
        d.insert(d.end(), r.begin(), r.end());
    if (d.empty())
        throw std::runtime_error("File '" + path + "' contains no d-spacing");
    return d;
}

/* ------------------------------------------------------------------------- */
CalibrationDataset::CalibrationDataset(Matrix data, std::vector<double> d_spacing)
    : data_(std::move(data)), d_spacing_(std::move(d_spacing))
{
    check_shape(data_);
}

CalibrationDataset::CalibrationDataset(Matrix data, const std::string& d_spacing_path)
    : data_(std::move(data)), d_spacing_(load_d_spacing_file(d_spacing_path))
{
    check_shape(data_);
}

CalibrationDataset
CalibrationDataset::from_rows(const std::vector<std::vector<double>>& rows,
                              std::vector<double> d_spacing)
{
    const std::size_t ncols = rows.empty() ? 3 : rows.front().size();
    Matrix m(static_cast<Eigen::Index>(rows.size()),
             static_cast<Eigen::Index>(ncols));

    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != ncols)
            throw DataShapeError("Row " + std::to_string(i) + " has " +
                                 std::to_string(rows[i].size()) +
                                 " columns, expected " + std::to_string(ncols));
        for (std::size_t j = 0; j < ncols; ++j)
            m(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
    }
    return CalibrationDataset(std::move(m), std::move(d_spacing));
}

CalibrationDataset
CalibrationDataset::load(const std::string& points_path, std::vector<double> d_spacing)
{
    const auto rows = read_ascii_rows(points_path);
    if (rows.empty())
        throw std::runtime_error("File '" + points_path + "' contains no valid data");
    return from_rows(rows, std::move(d_spacing));
}

void CalibrationDataset::load_d_spacing(const std::string& path)
{
    d_spacing_ = load_d_spacing_file(path);
}

std::vector<int> CalibrationDataset::rings() const
{
    std::vector<int> r(size());
    for (Eigen::Index i = 0; i < data_.rows(); ++i) {
        const double v = data_(i, 2);
        if (!(v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()))
            throw RingIndexError(v, d_spacing_.size());
        r[i] = static_cast<int>(v);
    }
    return r;
}

Vector CalibrationDataset::weights() const
{
    if (!has_weights())
        return Vector::Ones(data_.rows());
    return data_.col(3);
}

std::pair<double, double>
CalibrationDataset::guess_initial_center(const GeometryModel& geo) const
{
    if (empty())
        throw DegenerateInputError("guess_initial_center: dataset is empty");

    const double ring_min  = data_.col(2).minCoeff();
    const double threshold = ring_min + 1e-6;

    double sum1 = 0.0, sum2 = 0.0;
    int    n    = 0;
    for (Eigen::Index i = 0; i < data_.rows(); ++i) {
        if (!(data_(i, 2) < threshold)) continue;
        const auto pos = geo.calc_cartesian_positions(data_(i, 0), data_(i, 1));
        sum1 += pos.first;
        sum2 += pos.second;
        ++n;
    }
    return { sum1 / n, sum2 / n };
}

} // namespace ponifit
