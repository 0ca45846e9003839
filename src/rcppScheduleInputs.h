// conversion between R data frames / lists and the schedule engine types

#ifndef BATTERYSCHEDULEENGINE_RCPPSCHEDULEINPUTS_H
#define BATTERYSCHEDULEENGINE_RCPPSCHEDULEINPUTS_H

#include <RcppArmadillo.h>

#include "scheduleErrors.h"
#include "scheduleTypes.h"

#include <string>

inline arma::vec profileColumn(Rcpp::DataFrame Profiles, const char* name) {
  if (!Profiles.containsElementNamed(name)) {
    throw InvalidInputError(std::string("profile data is missing column '") + name + "'");
  }
  return(Rcpp::as<arma::vec>(Profiles[name]));
}

inline double batteryValue(Rcpp::DataFrame BatteryData, const char* name) {
  if (!BatteryData.containsElementNamed(name)) {
    throw InvalidInputError(std::string("battery data is missing column '") + name + "'");
  }
  Rcpp::NumericVector Column = BatteryData[name];
  if (Column.length() < 1) {
    throw InvalidInputError(std::string("battery data column '") + name + "' is empty");
  }
  return(Column(0));
}

// ImportTariff, ExportTariff, Demand, CarbonIntensity
inline ProfileData readProfileData(Rcpp::DataFrame Profiles) {

  ProfileData profile;

  profile.ImportTariff    = profileColumn(Profiles, "ImportTariff");
  profile.ExportTariff    = profileColumn(Profiles, "ExportTariff");
  profile.Demand          = profileColumn(Profiles, "Demand");
  profile.CarbonIntensity = profileColumn(Profiles, "CarbonIntensity");

  return(profile);

}

// Capacity, MaxCharge, MaxDischarge, Efficiency, InitialEnergy, optional ReserveEnergy
inline BatterySpec readBatterySpec(Rcpp::DataFrame BatteryData) {

  BatterySpec battery;

  battery.capacity_kwh        = batteryValue(BatteryData, "Capacity");
  battery.max_charge_kw       = batteryValue(BatteryData, "MaxCharge");
  battery.max_discharge_kw    = batteryValue(BatteryData, "MaxDischarge");
  battery.efficiency          = batteryValue(BatteryData, "Efficiency");
  battery.initial_energy_kwh  = batteryValue(BatteryData, "InitialEnergy");

  if (BatteryData.containsElementNamed("ReserveEnergy")) {
    battery.reserve_energy_kwh = batteryValue(BatteryData, "ReserveEnergy");
  }

  return(battery);

}

// Mode, TimestepHours, MinFinalEnergy, MaxFinalEnergy, SolverLogLevel, MaxSolveSeconds, Verbose
inline ScheduleOptions readScheduleOptions(Rcpp::List OptParameters) {

  ScheduleOptions options;

  if (OptParameters.containsElementNamed("Mode")) {
    std::string mode             = Rcpp::as<std::string>(OptParameters["Mode"]);
    options.mode                 = parseOptimizationMode(mode);
  }

  if (OptParameters.containsElementNamed("TimestepHours")) {
    options.timestep_hours       = Rcpp::as<double>(OptParameters["TimestepHours"]);
  }

  if (OptParameters.containsElementNamed("MinFinalEnergy")) {
    options.min_final_energy_kwh = Rcpp::as<double>(OptParameters["MinFinalEnergy"]);
  }

  if (OptParameters.containsElementNamed("MaxFinalEnergy")) {
    options.max_final_energy_kwh = Rcpp::as<double>(OptParameters["MaxFinalEnergy"]);
  }

  if (OptParameters.containsElementNamed("SolverLogLevel")) {
    options.solver_log_level     = Rcpp::as<int>(OptParameters["SolverLogLevel"]);
  }

  if (OptParameters.containsElementNamed("MaxSolveSeconds")) {
    options.max_solve_seconds    = Rcpp::as<double>(OptParameters["MaxSolveSeconds"]);
  }

  if (OptParameters.containsElementNamed("Verbose") && Rcpp::as<bool>(OptParameters["Verbose"])) {
    options.log                  = &Rcpp::Rcout;
  }

  return(options);

}

inline Rcpp::NumericVector toNumericVector(const arma::vec& Values) {
  return(Rcpp::NumericVector(Values.begin(), Values.end()));
}

// schedule flows and energy path as named list entries
inline void addSchedule(Rcpp::List& Out, const Schedule& schedule) {

  Out["Charge"]         = toNumericVector(schedule.Charge);
  Out["DischargeHome"]  = toNumericVector(schedule.DischargeHome);
  Out["DischargeGrid"]  = toNumericVector(schedule.DischargeGrid);
  Out["GridHome"]       = toNumericVector(schedule.GridHome);
  Out["Energy"]         = toNumericVector(schedule.Energy);

}

// cost totals in the tariff currency, carbon totals in grams CO2
inline void addSavings(Rcpp::List& Out, const SavingsReport& savings) {

  Out["CostSavings"]     = savings.cost_savings;
  Out["CarbonSavings"]   = savings.carbon_savings;
  Out["BaselineCost"]    = savings.baseline_cost;
  Out["OptimizedCost"]   = savings.optimized_cost;
  Out["BaselineCarbon"]  = savings.baseline_carbon;
  Out["OptimizedCarbon"] = savings.optimized_carbon;
  Out["CarbonUnit"]      = "gCO2";

}

#endif
