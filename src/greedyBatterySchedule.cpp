// greedy battery dispatch

// ranks timesteps by score and fills charge and discharge slots one at a time until no further
// slot can be scheduled without leaving the usable energy window

#include "greedyBatterySchedule.h"
#include "extractSchedule.h"
#include "scheduleErrors.h"
#include "validateScheduleInputs.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

arma::vec normalizeProfile(const arma::vec& Profile) {

  double lo = Profile.min();
  double hi = Profile.max();

  if (hi - lo <= 0) {
    return(arma::zeros<arma::vec>(Profile.n_elem));
  }

  return((Profile - lo) / (hi - lo));

}

// energy at each timestep boundary for a signed plan
arma::vec planEnergy(const arma::vec& Plan, double initial_energy, double efficiency, double dt) {

  arma::vec Energy(Plan.n_elem + 1);
  Energy(0) = initial_energy;

  for (arma::uword t = 0; t < Plan.n_elem; ++t) {
    double delta = (Plan(t) > 0) ? Plan(t) * dt * efficiency : Plan(t) * dt;
    Energy(t+1)  = Energy(t) + delta;
  }

  return(Energy);

}

}

GreedyScore parseGreedyScore(const std::string& score) {

  std::string name = score;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c){return std::tolower(c);});

  if (name == "cost")     {return(GreedyScore::Cost);}
  if (name == "carbon")   {return(GreedyScore::Carbon);}
  if (name == "weighted") {return(GreedyScore::Weighted);}

  throw InvalidInputError("unknown greedy mode '" + score + "', expected 'cost', 'carbon' or 'weighted'");

}

arma::vec greedyScore(const ProfileData& profile, const GreedyOptions& options) {

  switch (options.score) {
  case GreedyScore::Cost:
    return(profile.ImportTariff);
  case GreedyScore::Carbon:
    return(profile.CarbonIntensity);
  case GreedyScore::Weighted:
    return(options.alpha * normalizeProfile(profile.ImportTariff) +
           (1 - options.alpha) * normalizeProfile(profile.CarbonIntensity));
  }

  return(profile.ImportTariff);

}

arma::vec greedyBatterySchedule(const ProfileData& profile,
                                const BatterySpec& battery,
                                const GreedyOptions& options) {


  //////// Process Inputs ////////


  validateProfileData(profile);
  validateBatterySpec(battery);

  if (!(std::isfinite(options.timestep_hours) && options.timestep_hours > 0)) {
    throw InvalidInputError("timestep duration must be a positive number of hours");
  }

  if (!(options.alpha >= 0 && options.alpha <= 1)) {
    throw InvalidInputError("weighted mode alpha must be within [0, 1]");
  }

  if (arma::any(profile.Demand < 0)) {
    throw InvalidInputError("greedy dispatch requires non-negative demand");
  }

  double dt              = options.timestep_hours;
  double efficiency      = battery.efficiency;
  double initial_energy  = battery.initial_energy_kwh;
  double max_energy      = battery.capacity_kwh;
  double min_energy      = battery.reserve_energy_kwh;

  arma::uword num_steps  = profile.Demand.n_elem;

  arma::vec Score        = greedyScore(profile, options);

  arma::uvec ChargeOrder    = arma::stable_sort_index(Score, "ascend");
  arma::uvec DischargeOrder = arma::stable_sort_index(Score, "descend");

  arma::vec Plan         = arma::zeros<arma::vec>(num_steps);


  //////// Fill Slots ////////


  // every slot is scheduled at most once, so the loop ends after at most num_steps passes
  bool changed = true;

  while (changed) {

    changed = false;

    // charge pass, cheapest timesteps first
    for (arma::uword k = 0; k < num_steps; ++k) {

      arma::uword t = ChargeOrder(k);
      if (Plan(t) != 0) {continue;}

      // charging at t raises every later energy level
      arma::vec Energy  = planEnergy(Plan, initial_energy, efficiency, dt);
      double headroom   = max_energy - arma::max(Energy.subvec(t+1, num_steps));

      double power      = std::min(battery.max_charge_kw, headroom / (efficiency * dt));
      if (power <= 0) {continue;}

      Plan(t) = power;
      changed = true;

    }

    // discharge pass, most expensive timesteps first, serving home demand only
    for (arma::uword k = 0; k < num_steps; ++k) {

      arma::uword t = DischargeOrder(k);
      if (Plan(t) != 0) {continue;}

      // discharging at t lowers every later energy level
      arma::vec Energy  = planEnergy(Plan, initial_energy, efficiency, dt);
      double available  = arma::min(Energy.subvec(t+1, num_steps)) - min_energy;

      double power      = std::min(battery.max_discharge_kw,
                                   std::min(profile.Demand(t), available / dt));
      if (power <= 0) {continue;}

      Plan(t) = -power;
      changed = true;

    }

  }

  return(Plan);

}

Schedule scheduleFromPowerPlan(const arma::vec& PowerPlan,
                               const ProfileData& profile,
                               const BatterySpec& battery,
                               double timestep_hours) {

  arma::uword num_steps = profile.Demand.n_elem;

  if (PowerPlan.n_elem != num_steps) {
    throw InvalidInputError("power plan length must match the profile length");
  }

  Schedule schedule;

  schedule.Charge        = arma::clamp(PowerPlan, 0, arma::datum::inf);

  arma::vec Discharge    = arma::clamp(-PowerPlan, 0, arma::datum::inf);
  arma::vec HomeDemand   = arma::clamp(profile.Demand, 0, arma::datum::inf);

  schedule.DischargeHome = arma::min(Discharge, HomeDemand);
  schedule.DischargeGrid = Discharge - schedule.DischargeHome;
  schedule.GridHome      = profile.Demand - schedule.DischargeHome;

  schedule.Energy        = recomputeEnergy(schedule.Charge,
                                           schedule.DischargeHome,
                                           schedule.DischargeGrid,
                                           battery.initial_energy_kwh,
                                           battery.efficiency,
                                           timestep_hours);

  return(schedule);

}
