#include "xrfcal/JsonUtils.hpp"
#include "xrfcal/Errors.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace xrfcal {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot open: " + path);
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid JSON in " + path + ": " + e.what());
    }
}

void save_json(const nlohmann::json& j, const std::string& path, int indent)
{
    std::ofstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot write: " + path);
    f << j.dump(indent) << '\n';
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
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

std::string iso_timestamp_now()
{
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return os.str();
}

} // namespace xrfcal
