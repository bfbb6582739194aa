#include "xrfcal/LineDatabase.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/JsonUtils.hpp"
#include <array>

namespace xrfcal {

bool is_major_line(const std::string& name)
{
    static const std::array<const char*, 12> major = {
        "Ka1", "Ka2", "Kb1", "La1", "La2", "Lb1",
        "Kα1", "Kα2", "Kβ1", "Lα1", "Lα2", "Lβ1"
    };
    for (const char* m : major)
        if (name == m) return true;
    return false;
}

JsonLineDatabase::JsonLineDatabase(const nlohmann::json& doc)
{
    if (!doc.is_object())
        throw ConfigurationError("Line database must be a JSON object keyed by element");

    try {
        for (const auto& [symbol, series] : doc.items()) {
            LineSeries ls;
            for (const auto& [sname, lines] : series.items()) {
                auto& out = ls[sname];
                for (const auto& l : lines) {
                    EmissionLine e;
                    e.name   = l.at("name").get<std::string>();
                    e.energy = l.contains("energy") ? l["energy"].get<double>()
                                                    : l.at("energy_keV").get<double>();
                    out.push_back(e);
                }
            }
            table_[symbol] = std::move(ls);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Malformed line database: ") + e.what());
    }
}

JsonLineDatabase JsonLineDatabase::from_file(const std::string& path)
{
    return JsonLineDatabase(load_json(path));
}

LineSeries JsonLineDatabase::get_lines(const std::string& symbol) const
{
    const auto it = table_.find(symbol);
    return it == table_.end() ? LineSeries{} : it->second;
}

} // namespace xrfcal
