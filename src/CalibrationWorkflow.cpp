#include "ponifit/CalibrationWorkflow.hpp"
#include "ponifit/CalibrationDataset.hpp"
#include "ponifit/ExternalRefiner.hpp"
#include "ponifit/GeometryModel.hpp"
#include "ponifit/RefinementEngine.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ponifit {

RunResult run_calibration(const RunConfig& cfg)
{
    if (cfg.points_path.empty())
        throw std::runtime_error("No observation file given (\"points\" or --points)");

    std::vector<double> d_spacing = cfg.d_spacing_path.empty()
                                  ? cfg.d_spacing
                                  : load_d_spacing_file(cfg.d_spacing_path);

    const CalibrationDataset   dataset = CalibrationDataset::load(cfg.points_path,
                                                                  std::move(d_spacing));
    const FlatDetectorGeometry geometry(cfg.pixel1, cfg.pixel2);

    std::cout << "Loaded " << dataset.size() << " points ("
              << (dataset.has_weights() ? "weighted" : "unweighted") << "), "
              << dataset.d_spacing().size() << " reference rings\n";

    RefinementOptions opt;
    opt.verbose = cfg.verbose;

    RefinementEngine engine(dataset, geometry, cfg.initial, opt);
    if (cfg.guess_poni)
        engine.guess_poni();

    /* ---- bounds: tolerance window first, explicit values win ------- */
    if (cfg.tolerance)
        engine.set_tolerance(*cfg.tolerance);
    for (const auto& [p, v] : cfg.bound_min) engine.bounds().set_min(p, v);
    for (const auto& [p, v] : cfg.bound_max) engine.bounds().set_max(p, v);

    RunResult res;
    res.initial      = engine.pose();
    res.initial_chi2 = engine.chi2(engine.pose().to_vector6());
    std::cout << "Initial chi2 = " << res.initial_chi2 << "\n";

    for (const auto& step : cfg.strategies) {
        double c2 = 0.0;
        switch (step.kind) {
            case StrategyStep::Kind::Gradient:
                c2 = engine.gradient_refine();
                break;
            case StrategyStep::Kind::Bounded:
                c2 = engine.bounded_refine(step.max_iterations, step.fix);
                break;
            case StrategyStep::Kind::BoundedWavelength:
                c2 = engine.bounded_refine_wavelength(step.max_iterations, step.fix);
                break;
            case StrategyStep::Kind::Simplex:
                c2 = engine.simplex_refine(step.max_iterations);
                break;
            case StrategyStep::Kind::Anneal:
                engine.options().anneal.seed = step.seed;
                c2 = engine.anneal_refine(step.max_iterations);
                break;
            case StrategyStep::Kind::External: {
                LegacyToolRefiner tool(step.executable, cfg.verbose);
                c2 = engine.external_tool_refine(tool);
                break;
            }
        }
        res.history.push_back({ strategy_name(step.kind), c2 });
    }

    res.pose       = engine.pose();
    res.final_chi2 = engine.chi2(res.pose.to_vector6());
    return res;
}

/* ===================================================================== */
namespace {

nlohmann::json pose_to_json(const PoseParameters& pose)
{
    nlohmann::json j;
    for (int i = 0; i < kNParams; ++i) {
        const Param p = static_cast<Param>(i);
        j[param_name(p)] = pose.get(p);
    }
    return j;
}

} // unnamed namespace

nlohmann::json result_to_json(const RunResult& res)
{
    nlohmann::json j;
    j["initial"]     = pose_to_json(res.initial);
    j["pose"]        = pose_to_json(res.pose);
    j["initialChi2"] = res.initial_chi2;
    j["chi2"]        = res.final_chi2;

    j["history"] = nlohmann::json::array();
    for (const auto& h : res.history)
        j["history"].push_back({ { "strategy", h.strategy }, { "chi2", h.chi2 } });
    return j;
}

void write_result(const std::string& path, const RunResult& res)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write result to '" + path + "'");
    f << result_to_json(res).dump(4) << "\n";
    std::cout << "Result written to " << path << "\n";
}

} // namespace ponifit
