#pragma once
#include "Types.hpp"
#include <string>

namespace xrfcal {

// Energy-dispersive spectrum: strictly increasing energies (keV), counts ≥ 0
struct Spectrum {
    Vector      energy;
    Vector      counts;
    std::string label;

    Index size() const { return energy.size(); }

    // Throws ConfigurationError on empty, mismatched, non-finite,
    // negative or non-increasing data.
    void validate() const;

    // Index of the channel closest to e
    Index nearest_channel(double e) const;

    // Mean channel width in keV
    double channel_width() const;
};

/*  DER_SNR noise estimate (Stoehr et al. 2008):
 *      σ ≈ 0.6052697 · median |2 f_i − f_{i−2} − f_{i+2}| .
 *  Returns 0 for fewer than 6 samples.                                    */
double estimate_noise_der(const Vector& counts);

/*  Two columns (energy, counts); '#' starts a comment, whitespace or comma
 *  separated.  Throws ConfigurationError when the file cannot be read.    */
Spectrum load_ascii(const std::string& path);

void save_ascii(const Spectrum& sp, const std::string& path);

} // namespace xrfcal
