#pragma once
#include "Types.hpp"
#include "GeometryModel.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ponifit {

/* ------------------------------------------------------------------------- */
/*  Observed ring points                                                     */
/*                                                                           */
/*      col 0 : position along dim 1 (pixels)                                */
/*      col 1 : position along dim 2 (pixels)                                */
/*      col 2 : ring index (into the d-spacing table)                        */
/*      col 3 : weight (optional)                                            */
/*                                                                           */
/*  The d-spacing table is in Å.  Ring indices are only checked against it   */
/*  when residuals are evaluated.                                            */
/* ------------------------------------------------------------------------- */
class CalibrationDataset {
public:
    CalibrationDataset() = default;

    explicit CalibrationDataset(Matrix data,
                                std::vector<double> d_spacing = {});

    CalibrationDataset(Matrix data, const std::string& d_spacing_path);

    /* row-wise input, every row must have the same length (3 or 4) */
    static CalibrationDataset from_rows(const std::vector<std::vector<double>>& rows,
                                        std::vector<double> d_spacing = {});

    /* ASCII table, '#' comments and blank lines skipped */
    static CalibrationDataset load(const std::string& points_path,
                                   std::vector<double> d_spacing = {});

    std::size_t size()        const { return static_cast<std::size_t>(data_.rows()); }
    bool        empty()       const { return data_.rows() == 0; }
    int         columns()     const { return static_cast<int>(data_.cols()); }
    bool        has_weights() const { return data_.cols() == 4; }

    const Matrix& data() const { return data_; }

    Vector           pixel1()  const { return data_.col(0); }
    Vector           pixel2()  const { return data_.col(1); }
    std::vector<int> rings()   const;
    Vector           weights() const;

    const std::vector<double>& d_spacing() const { return d_spacing_; }
    void set_d_spacing(std::vector<double> d)    { d_spacing_ = std::move(d); }
    void load_d_spacing(const std::string& path);

    /*  Centroid (metric) of the points belonging to the innermost ring,
     *  i.e. all rows whose ring column is within 1e-6 of the minimum.
     *  Returns (poni1, poni2).                                             */
    std::pair<double, double> guess_initial_center(const GeometryModel& geo) const;

private:
    Matrix              data_;
    std::vector<double> d_spacing_;
};

/* one float per line, '#' comments allowed */
std::vector<double> load_d_spacing_file(const std::string& path);

} // namespace ponifit
