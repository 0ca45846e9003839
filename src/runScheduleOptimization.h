// single-shot battery schedule optimization

#ifndef BATTERYSCHEDULEENGINE_RUNSCHEDULEOPTIMIZATION_H
#define BATTERYSCHEDULEENGINE_RUNSCHEDULEOPTIMIZATION_H

#include "solveLinearProgram.h"

// throws the error matching a non-optimal solver status, returns for Optimal
void requireOptimalSolution(const LinearProgramSolution& solution);

// validates inputs, builds and solves the linear program, and reports savings against a
// home without a battery
//
// throws InvalidInputError, InfeasibleModelError, UnboundedModelError or SolverError, no
// schedule is produced on failure
ScheduleResult runScheduleOptimization(const ProfileData& profile,
                                       const BatterySpec& battery,
                                       const ScheduleOptions& options);

#endif
