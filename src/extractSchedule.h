// converts solver output into a per-timestep battery schedule

#ifndef BATTERYSCHEDULEENGINE_EXTRACTSCHEDULE_H
#define BATTERYSCHEDULEENGINE_EXTRACTSCHEDULE_H

#include "solveLinearProgram.h"

// requires an Optimal solution, throws SolverError otherwise
Schedule extractSchedule(const LinearProgram& model,
                         const LinearProgramSolution& solution,
                         const BatterySpec& battery,
                         double timestep_hours);

// energy at each timestep boundary implied by the flows, length N+1
arma::vec recomputeEnergy(const arma::vec& Charge,
                          const arma::vec& DischargeHome,
                          const arma::vec& DischargeGrid,
                          double initial_energy,
                          double efficiency,
                          double timestep_hours);

#endif
