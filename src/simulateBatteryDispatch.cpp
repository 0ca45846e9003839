// simulates battery energy for a requested dispatch plan (kW, + charge, - discharge)

#include <RcppArmadillo.h>

#include "rcppScheduleInputs.h"
#include "simulateBattery.h"

using namespace Rcpp;

// [[Rcpp::depends(RcppArmadillo)]]
// [[Rcpp::export]]
List simulateBatteryDispatch(NumericVector PowerPlan,
                             DataFrame BatteryData,
                             double TimestepHours = 1.0) {

  BatterySpec battery      = readBatterySpec(BatteryData);

  arma::vec Plan(PowerPlan.begin(), PowerPlan.length());
  int num_steps            = PowerPlan.length();

  BatterySimulation sim    = simulateBattery(Plan, num_steps, battery, TimestepHours);

  List Out;

  Out["ActualPower"]       = toNumericVector(sim.ActualPower);
  Out["Energy"]            = toNumericVector(sim.Energy);

  return(Out);

}
