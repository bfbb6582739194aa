#include "xrfcal/Spectrum.hpp"
#include "xrfcal/Errors.hpp"
#include "xrfcal/FitStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace xrfcal {

void Spectrum::validate() const
{
    if (energy.size() == 0)
        throw ConfigurationError("Spectrum '" + label + "' is empty");
    if (energy.size() != counts.size())
        throw ConfigurationError("Spectrum '" + label + "': energy and counts differ in length");
    if (!energy.allFinite() || !counts.allFinite())
        throw ConfigurationError("Spectrum '" + label + "' contains non-finite values");
    if (counts.minCoeff() < 0.0)
        throw ConfigurationError("Spectrum '" + label + "' has negative counts");
    for (Index i = 1; i < energy.size(); ++i) {
        if (!(energy[i] > energy[i - 1]))
            throw ConfigurationError("Spectrum '" + label + "': energy axis is not strictly increasing");
    }
}

Index Spectrum::nearest_channel(double e) const
{
    const double* first = energy.data();
    const double* last  = energy.data() + energy.size();
    const double* it = std::lower_bound(first, last, e);
    if (it == first) return 0;
    if (it == last)  return energy.size() - 1;
    const Index hi = it - first;
    return (std::abs(energy[hi] - e) < std::abs(energy[hi - 1] - e)) ? hi : hi - 1;
}

double Spectrum::channel_width() const
{
    if (energy.size() < 2) return 0.0;
    return (energy[energy.size() - 1] - energy[0]) / (energy.size() - 1);
}

double estimate_noise_der(const Vector& counts)
{
    const Index n = counts.size();
    if (n < 6) return 0.0;

    const double f3 = 0.6052697319;
    Vector diff(n - 4);
    for (Index i = 2; i < n - 2; ++i)
        diff[i - 2] = std::abs(2.0 * counts[i] - counts[i - 2] - counts[i + 2]);
    return f3 * median(diff);
}

Spectrum load_ascii(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot open: " + path);

    std::vector<Real> e, c;
    std::string line;
    while (std::getline(f, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream iss(line);
        Real a, b;
        if (!(iss >> a >> b)) continue;
        e.push_back(a);
        c.push_back(std::max(b, 0.0));
    }

    Spectrum sp;
    sp.label  = path;
    sp.energy = Eigen::Map<Vector>(e.data(), static_cast<Index>(e.size()));
    sp.counts = Eigen::Map<Vector>(c.data(), static_cast<Index>(c.size()));
    sp.validate();
    return sp;
}

void save_ascii(const Spectrum& sp, const std::string& path)
{
    std::ofstream f(path);
    if (!f.is_open()) throw ConfigurationError("Cannot write: " + path);
    f << "# energy_keV counts\n";
    f << std::setprecision(10);
    for (Index i = 0; i < sp.size(); ++i)
        f << sp.energy[i] << ' ' << sp.counts[i] << '\n';
}

} // namespace xrfcal
