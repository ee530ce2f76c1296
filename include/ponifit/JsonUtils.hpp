#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace ponifit {

/* parse a JSON file; throws std::runtime_error when it cannot be read */
nlohmann::json load_json(const std::string& path);

/* replace ${VAR} in every string value by the environment variable */
void expand_env(nlohmann::json& j);

} // namespace ponifit
