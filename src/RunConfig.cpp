#include "ponifit/RunConfig.hpp"
#include "ponifit/JsonUtils.hpp"
#include <stdexcept>

namespace ponifit {

namespace {

struct KindName {
    StrategyStep::Kind kind;
    const char*        name;
};

const KindName kKinds[] = {
    { StrategyStep::Kind::Gradient,          "gradient"           },
    { StrategyStep::Kind::Bounded,           "bounded"            },
    { StrategyStep::Kind::BoundedWavelength, "bounded_wavelength" },
    { StrategyStep::Kind::Simplex,           "simplex"            },
    { StrategyStep::Kind::Anneal,            "anneal"             },
    { StrategyStep::Kind::External,          "external"           },
};

const nlohmann::json& require(const nlohmann::json& j, const char* key)
{
    if (!j.contains(key))
        throw std::runtime_error(std::string("Missing required key '") + key + "'");
    return j.at(key);
}

FixedSet parse_fix(const nlohmann::json& arr)
{
    FixedSet fix;
    for (const auto& name : arr)
        fix.insert(param_from_name(name.get<std::string>()));
    return fix;
}

StrategyStep parse_step(const nlohmann::json& s)
{
    StrategyStep step;
    if (s.is_string()) {
        step.kind = strategy_from_name(s.get<std::string>());
    } else {
        step.kind = strategy_from_name(require(s, "name").get<std::string>());
    }
    if (!s.is_object()) return step;

    step.max_iterations = s.value("maxIterations", step.max_iterations);
    step.seed           = s.value("seed",          step.seed);
    step.executable     = s.value("executable",    step.executable);
    if (s.contains("fix"))
        step.fix = parse_fix(s.at("fix"));
    return step;
}

} // unnamed namespace

const char* strategy_name(StrategyStep::Kind k)
{
    for (const auto& kn : kKinds)
        if (kn.kind == k) return kn.name;
    throw std::out_of_range("strategy_name: bad strategy");
}

StrategyStep::Kind strategy_from_name(const std::string& name)
{
    for (const auto& kn : kKinds)
        if (name == kn.name) return kn.kind;
    throw std::invalid_argument("Unknown strategy '" + name + "'");
}

/* ===================================================================== */
RunConfig parse_run_config(const nlohmann::json& j)
{
    RunConfig cfg;

    const auto& det = require(j, "detector");
    cfg.pixel1 = require(det, "pixel1").get<double>();
    cfg.pixel2 = require(det, "pixel2").get<double>();

    cfg.points_path = j.value("points", std::string());

    const auto& d = require(j, "dSpacing");
    if (d.is_string())
        cfg.d_spacing_path = d.get<std::string>();
    else
        cfg.d_spacing = d.get<std::vector<double>>();

    /* ---- initial pose --------------------------------------------- */
    cfg.initial.wavelength = require(j, "wavelength").get<double>();
    const nlohmann::json guess = j.value("initialGuess", nlohmann::json::object());
    for (auto it = guess.begin(); it != guess.end(); ++it) {
        const Param p = param_from_name(it.key());
        if (p == Param::Wavelength)
            throw std::invalid_argument("initialGuess: give the wavelength at top level");
        cfg.initial.get(p) = it.value().get<double>();
    }
    cfg.guess_poni = !guess.contains("poni1") || !guess.contains("poni2");

    /* ---- bounds --------------------------------------------------- */
    if (j.contains("tolerance"))
        cfg.tolerance = j.at("tolerance").get<double>();

    if (j.contains("bounds")) {
        const auto& b = j.at("bounds");
        for (auto it = b.begin(); it != b.end(); ++it) {
            const Param p = param_from_name(it.key());
            if (it.value().contains("min")) cfg.bound_min[p] = it.value().at("min").get<double>();
            if (it.value().contains("max")) cfg.bound_max[p] = it.value().at("max").get<double>();
        }
    }

    /* ---- strategies ----------------------------------------------- */
    if (j.contains("strategies")) {
        for (const auto& s : j.at("strategies"))
            cfg.strategies.push_back(parse_step(s));
    } else {
        cfg.strategies.push_back(StrategyStep{});
    }

    cfg.output_path = j.value("output", std::string());
    cfg.verbose     = j.value("verbose", false);
    return cfg;
}

RunConfig load_run_config(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    return parse_run_config(j);
}

} // namespace ponifit
