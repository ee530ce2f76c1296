#pragma once
#include "PoseParameters.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ponifit {

/* one entry of the "strategies" list, run in order */
struct StrategyStep {
    enum class Kind { Gradient, Bounded, BoundedWavelength, Simplex, Anneal, External };

    Kind          kind           = Kind::Gradient;
    int           max_iterations = 1000000;
    FixedSet      fix            = { Param::Wavelength };
    std::uint64_t seed           = 42;
    std::string   executable     = "/opt/saxs/roca";
};

const char*        strategy_name(StrategyStep::Kind k);
StrategyStep::Kind strategy_from_name(const std::string& name);

/* ------------------------------------------------------------------------- */
/*  Run description read from JSON                                           */
/*                                                                           */
/*  {                                                                        */
/*    "detector":     { "pixel1": 1e-4, "pixel2": 1e-4 },                    */
/*    "wavelength":   1e-10,                                                 */
/*    "dSpacing":     [ 3.0, 2.1 ]   or   "lab6.d",                          */
/*    "points":       "points.txt",                                          */
/*    "initialGuess": { "dist": 0.1, "poni1": 0.05, ... },                   */
/*    "bounds":       { "dist": { "min": 0.05, "max": 0.2 }, ... },          */
/*    "tolerance":    10,                                                    */
/*    "strategies":   [ { "name": "bounded", "maxIterations": 1000,          */
/*                        "fix": [ "wavelength", "rot3" ] }, ... ],          */
/*    "output":       "result.json",                                         */
/*    "verbose":      false                                                  */
/*  }                                                                        */
/*                                                                           */
/*  poni1 / poni2 missing from initialGuess -> centroid of the inner ring.   */
/* ------------------------------------------------------------------------- */
struct RunConfig {
    double                       pixel1 = 0.0;
    double                       pixel2 = 0.0;
    std::string                  points_path;
    std::vector<double>          d_spacing;
    std::string                  d_spacing_path;     // used when non-empty
    PoseParameters               initial;
    bool                         guess_poni = false;
    std::optional<double>        tolerance;
    std::map<Param, double>      bound_min;
    std::map<Param, double>      bound_max;
    std::vector<StrategyStep>    strategies;
    std::string                  output_path;
    bool                         verbose = false;
};

RunConfig parse_run_config(const nlohmann::json& j);

/* load_json + expand_env + parse_run_config */
RunConfig load_run_config(const std::string& path);

} // namespace ponifit
