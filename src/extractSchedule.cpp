// reads optimized flows from the solution and rebuilds the energy path from them

#include "extractSchedule.h"
#include "scheduleErrors.h"

arma::vec recomputeEnergy(const arma::vec& Charge,
                          const arma::vec& DischargeHome,
                          const arma::vec& DischargeGrid,
                          double initial_energy,
                          double efficiency,
                          double timestep_hours) {

  arma::uword num_steps = Charge.n_elem;
  double dt             = timestep_hours;

  arma::vec Energy(num_steps + 1);
  Energy(0) = initial_energy;

  for (arma::uword t = 0; t < num_steps; ++t) {
    Energy(t+1) = Energy(t) + efficiency * Charge(t) * dt - (DischargeHome(t) + DischargeGrid(t)) * dt;
  }

  return(Energy);

}

Schedule extractSchedule(const LinearProgram& model,
                         const LinearProgramSolution& solution,
                         const BatterySpec& battery,
                         double timestep_hours) {

  if (solution.status != SolveStatus::Optimal) {
    throw SolverError("cannot extract a schedule from a " + solveStatusName(solution.status) + " solution");
  }

  const ScheduleModelLayout& layout = model.layout;

  if (solution.Values.n_elem != layout.num_columns) {
    throw SolverError("solution has the wrong number of values for the schedule model");
  }

  arma::uword num_steps = layout.num_steps;

  Schedule schedule;

  schedule.Charge        = solution.Values.subvec(layout.pos_charge,         layout.pos_charge + num_steps - 1);
  schedule.DischargeHome = solution.Values.subvec(layout.pos_discharge_home, layout.pos_discharge_home + num_steps - 1);
  schedule.DischargeGrid = solution.Values.subvec(layout.pos_discharge_grid, layout.pos_discharge_grid + num_steps - 1);
  schedule.GridHome      = solution.Values.subvec(layout.pos_grid_home,      layout.pos_grid_home + num_steps - 1);

  // solver energy columns are ignored, the path is rebuilt from the flows
  schedule.Energy        = recomputeEnergy(schedule.Charge,
                                           schedule.DischargeHome,
                                           schedule.DischargeGrid,
                                           battery.initial_energy_kwh,
                                           battery.efficiency,
                                           timestep_hours);

  return(schedule);

}
