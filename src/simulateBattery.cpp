// battery simulation for a requested charge/discharge plan

#include "simulateBattery.h"
#include "scheduleErrors.h"
#include "validateScheduleInputs.h"

#include <algorithm>
#include <cmath>
#include <sstream>

BatterySimulation simulateBattery(const arma::vec& PowerPlan,
                                  arma::uword num_steps,
                                  const BatterySpec& battery,
                                  double timestep_hours) {

  validateBatterySpec(battery);

  if (!(std::isfinite(timestep_hours) && timestep_hours > 0)) {
    throw InvalidInputError("timestep duration must be a positive number of hours");
  }

  arma::vec Plan = PowerPlan;

  if (Plan.is_empty()) {
    Plan = arma::zeros<arma::vec>(num_steps);
  }

  if (Plan.n_elem != num_steps) {
    std::ostringstream out;
    out << "power plan has " << Plan.n_elem << " entries, expected " << num_steps;
    throw InvalidInputError(out.str());
  }

  if (!Plan.is_finite()) {
    throw InvalidInputError("power plan must contain only finite values");
  }

  double dt             = timestep_hours;
  double efficiency     = battery.efficiency;
  double max_energy     = battery.capacity_kwh;
  double min_energy     = battery.reserve_energy_kwh;

  BatterySimulation out;
  out.ActualPower       = arma::zeros<arma::vec>(num_steps);
  out.Energy            = arma::zeros<arma::vec>(num_steps + 1);

  double energy = battery.initial_energy_kwh;
  out.Energy(0) = energy;

  for (arma::uword t = 0; t < num_steps; ++t) {

    double power = Plan(t);
    double energy_delta;

    // clip requested power to rated limits, efficiency applies on charge only
    if (power > 0) {
      power        = std::min(power, battery.max_charge_kw);
      energy_delta = power * dt * efficiency;
    } else {
      power        = std::max(power, -battery.max_discharge_kw);
      energy_delta = power * dt;
    }

    // clip to the usable energy window and back out the power actually delivered
    double new_energy = energy + energy_delta;

    if (new_energy > max_energy) {
      energy_delta = max_energy - energy;
      power        = energy_delta / (dt * efficiency);
      new_energy   = max_energy;
    } else if (new_energy < min_energy) {
      energy_delta = min_energy - energy;
      power        = energy_delta / dt;
      new_energy   = min_energy;
    }

    out.ActualPower(t) = power;
    out.Energy(t+1)    = new_energy;

    energy = new_energy;

  }

  return(out);

}
