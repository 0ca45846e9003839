// battery schedule optimization engine

// builds one linear program per run from fresh inputs, nothing is shared between runs

#include "runScheduleOptimization.h"
#include "buildScheduleModel.h"
#include "calculateSavings.h"
#include "extractSchedule.h"
#include "scheduleErrors.h"
#include "selectObjective.h"
#include "validateScheduleInputs.h"

void requireOptimalSolution(const LinearProgramSolution& solution) {

  switch (solution.status) {
  case SolveStatus::Optimal:
    return;
  case SolveStatus::Infeasible:
    throw InfeasibleModelError(solution.message);
  case SolveStatus::Unbounded:
    throw UnboundedModelError(solution.message);
  case SolveStatus::SolverError:
    throw SolverError(solution.message);
  }

  throw SolverError("unrecognized solve status");

}

ScheduleResult runScheduleOptimization(const ProfileData& profile,
                                       const BatterySpec& battery,
                                       const ScheduleOptions& options) {

  validateScheduleInputs(profile, battery, options);

  double dt = options.timestep_hours;

  // feasible region, then the objective for the active mode
  LinearProgram model = buildScheduleModel(profile, battery, options);
  model.Objective     = selectObjective(model.layout, profile, options.mode, dt);

  SolverSettings settings;
  settings.log_level   = options.solver_log_level;
  settings.max_seconds = options.max_solve_seconds;

  LinearProgramSolution solution = solveLinearProgram(model, settings);

  if (options.log) {
    *options.log << "LP status: " << solveStatusName(solution.status)
                 << " (" << optimizationModeName(options.mode) << " mode, "
                 << model.layout.num_steps << " timesteps, "
                 << solution.num_iterations << " iterations)" << std::endl;
  }

  requireOptimalSolution(solution);

  ScheduleResult result;

  result.mode            = options.mode;
  result.schedule        = extractSchedule(model, solution, battery, dt);
  result.savings         = calculateSavings(profile, result.schedule, dt);
  result.objective_value = solution.objective_value;
  result.num_iterations  = solution.num_iterations;

  if (options.log) {
    *options.log << "Objective value: " << result.objective_value << std::endl;
  }

  return(result);

}
