// include/sim_errors.hh
#ifndef SIM_ERRORS_HH
#define SIM_ERRORS_HH

#include <stdexcept>
#include <string>

// Base for runtime failures raised by the simulator
class SimError : public std::runtime_error {
public:
    explicit SimError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed input: bad policy, bad registration, scheduler misuse
// (negative delay, non-advancing run target).
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// Unknown source/destination id on a channel or controller
class AddressError : public SimError {
public:
    explicit AddressError(const std::string& what) : SimError(what) {}
};

#endif // SIM_ERRORS_HH
