// input checks run before any model is built

#ifndef BATTERYSCHEDULEENGINE_VALIDATESCHEDULEINPUTS_H
#define BATTERYSCHEDULEENGINE_VALIDATESCHEDULEINPUTS_H

#include "scheduleTypes.h"

// throws InvalidInputError naming the first violated constraint
void validateProfileData(const ProfileData& profile);
void validateBatterySpec(const BatterySpec& battery);
void validateScheduleOptions(const ScheduleOptions& options, const BatterySpec& battery);

void validateScheduleInputs(const ProfileData& profile,
                            const BatterySpec& battery,
                            const ScheduleOptions& options);

#endif
