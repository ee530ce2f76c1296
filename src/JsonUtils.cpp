#include "ponifit/JsonUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace ponifit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open configuration '" + path + "'");
    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in '" + path + "': " + e.what());
    }
    return j;
}

/* single pass: substituted values are not expanded again */
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out;
    auto pos = input.cbegin();
    for (std::sregex_iterator it(input.begin(), input.end(), re), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(pos, m[0].first);
        const char* env = std::getenv(m[1].str().c_str());
        if (env) out += env;
        pos = m[0].second;
    }
    out.append(pos, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace ponifit
