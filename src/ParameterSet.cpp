#include "xrfcal/ParameterSet.hpp"
#include "xrfcal/Errors.hpp"
#include <algorithm>
#include <cmath>

namespace xrfcal {

void ParameterSet::add(const std::string& name, double value, double lower, double upper,
                       bool frozen)
{
    if (name_to_idx_.count(name))
        throw ConfigurationError("Parameter '" + name + "' defined twice");
    if (lower > upper)
        throw ConfigurationError("Parameter '" + name + "': lower bound above upper bound");
    if (!std::isfinite(value))
        throw ConfigurationError("Parameter '" + name + "': non-finite start value");

    name_to_idx_[name] = params_.size();
    params_.push_back({name, std::clamp(value, lower, upper), lower, upper, frozen});
}

std::size_t ParameterSet::n_free() const
{
    return static_cast<std::size_t>(std::count_if(params_.begin(), params_.end(),
                                                  [](const ParameterInfo& p) { return !p.frozen; }));
}

std::size_t ParameterSet::index_of(const std::string& name) const
{
    const auto it = name_to_idx_.find(name);
    if (it == name_to_idx_.end())
        throw ConfigurationError("Unknown parameter '" + name + "'");
    return it->second;
}

bool ParameterSet::contains(const std::string& name) const
{
    return name_to_idx_.count(name) != 0;
}

double ParameterSet::value(const std::string& name) const
{
    return params_[index_of(name)].value;
}

void ParameterSet::set(const std::string& name, double v)
{
    auto& p = params_[index_of(name)];
    p.value = std::clamp(v, p.lower, p.upper);
}

void ParameterSet::freeze(const std::string& name, bool frozen)
{
    params_[index_of(name)].frozen = frozen;
}

const ParameterInfo& ParameterSet::info(const std::string& name) const
{
    return params_[index_of(name)];
}

/* ----------------------------- packed vectors ----------------------------- */

Vector ParameterSet::free_values() const
{
    Vector x(static_cast<Index>(n_free()));
    Index k = 0;
    for (const auto& p : params_)
        if (!p.frozen) x[k++] = p.value;
    return x;
}

void ParameterSet::set_free_values(const Vector& x)
{
    if (x.size() != static_cast<Index>(n_free()))
        throw ConfigurationError("Free parameter vector has the wrong length");
    Index k = 0;
    for (auto& p : params_)
        if (!p.frozen) p.value = std::clamp(x[k++], p.lower, p.upper);
}

Vector ParameterSet::free_lower() const
{
    Vector x(static_cast<Index>(n_free()));
    Index k = 0;
    for (const auto& p : params_)
        if (!p.frozen) x[k++] = p.lower;
    return x;
}

Vector ParameterSet::free_upper() const
{
    Vector x(static_cast<Index>(n_free()));
    Index k = 0;
    for (const auto& p : params_)
        if (!p.frozen) x[k++] = p.upper;
    return x;
}

Vector ParameterSet::to_unit(const Vector& free) const
{
    const Vector lo = free_lower();
    const Vector hi = free_upper();
    if (!lo.allFinite() || !hi.allFinite())
        throw ConfigurationError("Unit mapping needs finite bounds on every free parameter");

    Vector u(free.size());
    for (Index i = 0; i < free.size(); ++i) {
        const double w = hi[i] - lo[i];
        u[i] = w > 0.0 ? std::clamp((free[i] - lo[i]) / w, 0.0, 1.0) : 0.0;
    }
    return u;
}

Vector ParameterSet::from_unit(const Vector& unit) const
{
    const Vector lo = free_lower();
    const Vector hi = free_upper();
    return (lo.array() + unit.array().min(1.0).max(0.0) * (hi - lo).array()).matrix();
}

} // namespace xrfcal
