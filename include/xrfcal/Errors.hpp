#pragma once
#include <stdexcept>
#include <string>

namespace xrfcal {

/* Unknown method / model / shape names, malformed options, unreadable files. */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Too few channels, peaks or points for the requested operation. */
class InsufficientDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Nonlinear solver produced a non-finite state. */
class FitDivergenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace xrfcal
