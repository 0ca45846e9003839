// heuristic charge/discharge plan used as a comparison for the optimized schedule

#ifndef BATTERYSCHEDULEENGINE_GREEDYBATTERYSCHEDULE_H
#define BATTERYSCHEDULEENGINE_GREEDYBATTERYSCHEDULE_H

#include "scheduleTypes.h"

#include <string>

enum class GreedyScore {
  Cost,       // import tariff
  Carbon,     // carbon intensity
  Weighted    // alpha * normalized import tariff + (1 - alpha) * normalized carbon intensity
};

GreedyScore parseGreedyScore(const std::string& score);

struct GreedyOptions {
  GreedyScore score      = GreedyScore::Cost;
  double alpha           = 0.5;
  double timestep_hours  = 1;
};

// ranking score per timestep, lower is a better time to charge
arma::vec greedyScore(const ProfileData& profile, const GreedyOptions& options);

// signed plan in kW, + charge and - discharge
//
// charges in the lowest scoring timesteps and discharges up to the home demand in the highest
// scoring ones, keeping energy within [reserve, capacity] at every step
arma::vec greedyBatterySchedule(const ProfileData& profile,
                                const BatterySpec& battery,
                                const GreedyOptions& options);

// splits a signed plan into schedule flows, battery discharge serves the home first and any
// surplus is exported
Schedule scheduleFromPowerPlan(const arma::vec& PowerPlan,
                               const ProfileData& profile,
                               const BatterySpec& battery,
                               double timestep_hours);

#endif
