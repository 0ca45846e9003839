// value types shared by the battery schedule optimizer

#ifndef BATTERYSCHEDULEENGINE_SCHEDULETYPES_H
#define BATTERYSCHEDULEENGINE_SCHEDULETYPES_H

#include <armadillo>

#include <limits>
#include <ostream>
#include <string>

enum class OptimizationMode {
  Cost,
  Carbon
};

// per-timestep input profiles, all of equal length
struct ProfileData {
  arma::vec ImportTariff;      // currency / kWh
  arma::vec ExportTariff;      // currency / kWh
  arma::vec Demand;            // kW
  arma::vec CarbonIntensity;   // gCO2 / kWh
};

struct BatterySpec {
  double capacity_kwh          = 0;
  double max_charge_kw         = 0;
  double max_discharge_kw      = 0;
  double efficiency            = 1;   // applied on the charging leg only
  double initial_energy_kwh    = 0;
  double reserve_energy_kwh    = 0;   // minimum usable energy kept in the battery
};

struct ScheduleOptions {
  OptimizationMode mode        = OptimizationMode::Cost;
  double timestep_hours        = 1;

  // bounds on energy at the end of the horizon, infinite when unused
  double min_final_energy_kwh  = -std::numeric_limits<double>::infinity();
  double max_final_energy_kwh  = std::numeric_limits<double>::infinity();

  int solver_log_level         = 0;
  double max_solve_seconds     = -1;  // <= 0 means no limit

  // diagnostics sink, nothing is written when null
  std::ostream* log            = nullptr;
};

// optimized flows (length N) and energy at the start of each timestep (length N+1)
struct Schedule {
  arma::vec Charge;
  arma::vec DischargeHome;
  arma::vec DischargeGrid;
  arma::vec GridHome;
  arma::vec Energy;
};

// both metrics are reported, only the one matching the run's mode was optimized
// cost in tariff currency, carbon in grams CO2 (gCO2 / kWh x kWh, no conversion to kg)
struct SavingsReport {
  double cost_savings          = 0;
  double carbon_savings        = 0;

  double baseline_cost         = 0;
  double optimized_cost        = 0;
  double baseline_carbon       = 0;
  double optimized_carbon      = 0;
};

struct ScheduleResult {
  OptimizationMode mode        = OptimizationMode::Cost;   // objective that was minimized
  Schedule schedule;
  SavingsReport savings;
  double objective_value       = 0;
  int num_iterations           = 0;
};

OptimizationMode parseOptimizationMode(const std::string& mode);
std::string optimizationModeName(OptimizationMode mode);

#endif
