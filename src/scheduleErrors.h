// error taxonomy for schedule optimization runs, every error is terminal for the run

#ifndef BATTERYSCHEDULEENGINE_SCHEDULEERRORS_H
#define BATTERYSCHEDULEENGINE_SCHEDULEERRORS_H

#include <stdexcept>
#include <string>

class ScheduleError : public std::runtime_error {
public:
  explicit ScheduleError(const std::string& message) : std::runtime_error(message) {}
};

// malformed or inconsistent inputs, raised before any model is built
class InvalidInputError : public ScheduleError {
public:
  explicit InvalidInputError(const std::string& message)
    : ScheduleError("invalid input: " + message) {}
};

class InfeasibleModelError : public ScheduleError {
public:
  explicit InfeasibleModelError(const std::string& message)
    : ScheduleError("infeasible model: " + message) {}
};

// variables are bounded over a finite horizon, so this indicates a model builder defect
class UnboundedModelError : public ScheduleError {
public:
  explicit UnboundedModelError(const std::string& message)
    : ScheduleError("unbounded model: " + message) {}
};

class SolverError : public ScheduleError {
public:
  explicit SolverError(const std::string& message)
    : ScheduleError("solver error: " + message) {}
};

#endif
