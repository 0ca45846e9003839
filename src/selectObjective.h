// linear objective for the schedule model

#ifndef BATTERYSCHEDULEENGINE_SELECTOBJECTIVE_H
#define BATTERYSCHEDULEENGINE_SELECTOBJECTIVE_H

#include "buildScheduleModel.h"

// cost:   sum_t ((grid_home + charge) * import - discharge_grid * export) * dt
// carbon: sum_t (grid_home + charge) * carbon_intensity * dt
//
// exports earn revenue in cost mode but carry no carbon credit
arma::vec selectObjective(const ScheduleModelLayout& layout,
                          const ProfileData& profile,
                          OptimizationMode mode,
                          double timestep_hours);

#endif
