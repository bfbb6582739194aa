#pragma once
#include "Types.hpp"
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace xrfcal {

struct ParameterInfo {
    std::string name;
    double value  = 0.0;
    double lower  = -std::numeric_limits<double>::infinity();
    double upper  =  std::numeric_limits<double>::infinity();
    bool   frozen = false;
};

/*
 *  Named, bounded parameters with a packed vector of the free ones.
 *  Optimisers work on the free vector, optionally mapped to the unit box
 *  u = (x − lower)/(upper − lower).  Unit mapping needs finite bounds.
 */
class ParameterSet {
public:
    // value is clamped into [lower, upper]; duplicate names and lower > upper throw
    void add(const std::string& name, double value, double lower, double upper,
             bool frozen = false);

    std::size_t size()   const { return params_.size(); }
    std::size_t n_free() const;

    bool   contains(const std::string& name) const;
    double value(const std::string& name) const;
    void   set(const std::string& name, double v);       // clamped
    void   freeze(const std::string& name, bool frozen = true);
    const ParameterInfo& info(const std::string& name) const;

    const std::vector<ParameterInfo>& parameters() const { return params_; }

    Vector free_values() const;
    void   set_free_values(const Vector& x);
    Vector free_lower() const;
    Vector free_upper() const;

    Vector to_unit(const Vector& free) const;
    Vector from_unit(const Vector& unit) const;

private:
    std::size_t index_of(const std::string& name) const;

    std::vector<ParameterInfo>              params_;
    std::unordered_map<std::string, size_t> name_to_idx_;
};

} // namespace xrfcal
