// adapter between the schedule model and the COIN-OR Clp simplex solver

#ifndef BATTERYSCHEDULEENGINE_SOLVELINEARPROGRAM_H
#define BATTERYSCHEDULEENGINE_SOLVELINEARPROGRAM_H

#include "buildScheduleModel.h"

#include <string>

enum class SolveStatus {
  Optimal,
  Infeasible,
  Unbounded,
  SolverError
};

std::string solveStatusName(SolveStatus status);

struct SolverSettings {
  int log_level        = 0;    // Clp log level, 0 is silent
  double max_seconds   = -1;   // <= 0 means no limit
};

struct LinearProgramSolution {
  SolveStatus status   = SolveStatus::SolverError;

  // one value per model column, only filled when the status is Optimal
  arma::vec Values;

  double objective_value = 0;
  int num_iterations     = 0;

  // raw Clp status codes, kept for diagnostics
  int solver_status      = -1;
  int secondary_status   = 0;

  std::string message;
};

// solves min Objective' x over the model, never throws for model-related outcomes
LinearProgramSolution solveLinearProgram(const LinearProgram& model,
                                         const SolverSettings& settings);

#endif
