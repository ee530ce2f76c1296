#pragma once
#include "PoseParameters.hpp"
#include "RunConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ponifit {

struct StepRecord {
    std::string strategy;
    double      chi2 = 0.0;   // after the commit decision
};

struct RunResult {
    PoseParameters          initial;
    PoseParameters          pose;
    double                  initial_chi2 = 0.0;
    double                  final_chi2   = 0.0;
    std::vector<StepRecord> history;
};

/*  Load the observations, set up geometry and bounds and run every
 *  strategy of the configuration in order.                              */
RunResult run_calibration(const RunConfig& cfg);

nlohmann::json result_to_json(const RunResult& res);

/* pretty-printed JSON, throws when the file cannot be written */
void write_result(const std::string& path, const RunResult& res);

} // namespace ponifit
