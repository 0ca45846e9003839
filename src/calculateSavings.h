// cost and carbon totals of a schedule compared with a home without a battery

#ifndef BATTERYSCHEDULEENGINE_CALCULATESAVINGS_H
#define BATTERYSCHEDULEENGINE_CALCULATESAVINGS_H

#include "scheduleTypes.h"

// totals over the horizon, flows in kW and timestep_hours converting to kWh
double scheduleCost(const ProfileData& profile, const Schedule& schedule, double timestep_hours);
double scheduleCarbon(const ProfileData& profile, const Schedule& schedule, double timestep_hours);

// demand met entirely from the grid
double baselineCost(const ProfileData& profile, double timestep_hours);
double baselineCarbon(const ProfileData& profile, double timestep_hours);

// savings = baseline - schedule, negative values mean the schedule is worse than no battery
SavingsReport calculateSavings(const ProfileData& profile,
                               const Schedule& schedule,
                               double timestep_hours);

#endif
