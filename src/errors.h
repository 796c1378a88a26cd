// errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace shift_roster
{
    // Invalid counts or indices. Raised while building the model, before the solver runs.
    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
    };

    // The solving engine failed or rejected the model. Never an infeasibility verdict.
    class SolverFault : public std::runtime_error
    {
    public:
        explicit SolverFault(const std::string &msg) : std::runtime_error(msg) {}
    };

    // A decoded roster breaks one of the scheduling policies.
    class RosterViolation : public std::runtime_error
    {
    public:
        explicit RosterViolation(const std::string &msg) : std::runtime_error(msg) {}
    };

} // namespace shift_roster
