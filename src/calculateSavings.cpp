// evaluates the objective integrands on a schedule and on the no-battery baseline

#include "calculateSavings.h"

double scheduleCost(const ProfileData& profile, const Schedule& schedule, double timestep_hours) {

  arma::vec Imported = schedule.GridHome + schedule.Charge;

  double cost = arma::dot(Imported, profile.ImportTariff) -
                arma::dot(schedule.DischargeGrid, profile.ExportTariff);

  return(cost * timestep_hours);

}

double scheduleCarbon(const ProfileData& profile, const Schedule& schedule, double timestep_hours) {

  // exported energy earns no carbon credit
  arma::vec Imported = schedule.GridHome + schedule.Charge;

  return(arma::dot(Imported, profile.CarbonIntensity) * timestep_hours);

}

double baselineCost(const ProfileData& profile, double timestep_hours) {
  return(arma::dot(profile.Demand, profile.ImportTariff) * timestep_hours);
}

double baselineCarbon(const ProfileData& profile, double timestep_hours) {
  return(arma::dot(profile.Demand, profile.CarbonIntensity) * timestep_hours);
}

SavingsReport calculateSavings(const ProfileData& profile,
                               const Schedule& schedule,
                               double timestep_hours) {

  SavingsReport report;

  report.baseline_cost    = baselineCost(profile, timestep_hours);
  report.optimized_cost   = scheduleCost(profile, schedule, timestep_hours);
  report.baseline_carbon  = baselineCarbon(profile, timestep_hours);
  report.optimized_carbon = scheduleCarbon(profile, schedule, timestep_hours);

  report.cost_savings     = report.baseline_cost - report.optimized_cost;
  report.carbon_savings   = report.baseline_carbon - report.optimized_carbon;

  return(report);

}
