// greedy battery dispatch for comparison with the optimized schedule

#include <RcppArmadillo.h>

#include "calculateSavings.h"
#include "greedyBatterySchedule.h"
#include "rcppScheduleInputs.h"

using namespace Rcpp;

// [[Rcpp::depends(RcppArmadillo)]]
// [[Rcpp::export]]
List greedyBatteryDispatch(DataFrame Profiles,
                           DataFrame BatteryData,
                           List OptParameters) {

  ProfileData profile      = readProfileData(Profiles);
  BatterySpec battery      = readBatterySpec(BatteryData);

  // OptParameters values
  GreedyOptions options;

  if (OptParameters.containsElementNamed("Mode")) {
    options.score          = parseGreedyScore(as<std::string>(OptParameters["Mode"]));
  }
  if (OptParameters.containsElementNamed("Alpha")) {
    options.alpha          = as<double>(OptParameters["Alpha"]);
  }
  if (OptParameters.containsElementNamed("TimestepHours")) {
    options.timestep_hours = as<double>(OptParameters["TimestepHours"]);
  }

  arma::vec Plan           = greedyBatterySchedule(profile, battery, options);
  Schedule schedule        = scheduleFromPowerPlan(Plan, profile, battery, options.timestep_hours);
  SavingsReport savings    = calculateSavings(profile, schedule, options.timestep_hours);

  List Out;

  Out["PowerPlan"]         = toNumericVector(Plan);
  addSchedule(Out, schedule);
  addSavings(Out, savings);

  return(Out);

}
