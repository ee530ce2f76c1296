#pragma once
#include <stdexcept>
#include <string>

namespace ponifit {

/* Base class of every failure raised by the calibration core.              */
class CalibrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Observation table is not N×3 / N×4 or rows have differing lengths.       */
class DataShapeError : public CalibrationError {
public:
    using CalibrationError::CalibrationError;
};

/* An observation refers to a ring that has no d-spacing entry.             */
class RingIndexError : public CalibrationError {
public:
    RingIndexError(int ring, std::size_t n_rings)
        : CalibrationError("ring index " + std::to_string(ring) +
                           " outside d-spacing table of size " +
                           std::to_string(n_rings))
        , ring_(ring)
    {}

    /* ring column entry that does not even fit an int (ring() is -1) */
    RingIndexError(double value, std::size_t n_rings)
        : CalibrationError("ring column value " + std::to_string(value) +
                           " is not an index into d-spacing table of size " +
                           std::to_string(n_rings))
        , ring_(-1)
    {}

    int ring() const { return ring_; }

private:
    int ring_;
};

/* Input too small to derive anything meaningful (e.g. empty dataset).      */
class DegenerateInputError : public CalibrationError {
public:
    using CalibrationError::CalibrationError;
};

/* The legacy refinement executable is missing, failed or said nothing.     */
class ExternalToolError : public CalibrationError {
public:
    using CalibrationError::CalibrationError;
};

} // namespace ponifit
