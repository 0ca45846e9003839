// validates profiles, battery parameters, and run options for schedule optimization

#include "validateScheduleInputs.h"
#include "scheduleErrors.h"

#include <cmath>
#include <sstream>

namespace {

void requireFiniteProfile(const arma::vec& Profile, const char* name) {
  if (!Profile.is_finite()) {
    throw InvalidInputError(std::string(name) + " profile must contain only finite values");
  }
}

void requireFinite(double value, const char* name) {
  if (!std::isfinite(value)) {
    throw InvalidInputError(std::string(name) + " must be finite");
  }
}

std::string describe(const char* name, double value) {
  std::ostringstream out;
  out << name << " = " << value;
  return(out.str());
}

}

void validateProfileData(const ProfileData& profile) {

  arma::uword num_steps = profile.Demand.n_elem;

  if (num_steps < 1) {
    throw InvalidInputError("profile length must be at least 1 timestep");
  }

  if (profile.ImportTariff.n_elem != num_steps ||
      profile.ExportTariff.n_elem != num_steps ||
      profile.CarbonIntensity.n_elem != num_steps) {

    std::ostringstream out;
    out << "profiles must have equal length (import tariff " << profile.ImportTariff.n_elem
        << ", export tariff " << profile.ExportTariff.n_elem
        << ", demand " << num_steps
        << ", carbon intensity " << profile.CarbonIntensity.n_elem << ")";
    throw InvalidInputError(out.str());

  }

  requireFiniteProfile(profile.ImportTariff, "import tariff");
  requireFiniteProfile(profile.ExportTariff, "export tariff");
  requireFiniteProfile(profile.Demand, "demand");
  requireFiniteProfile(profile.CarbonIntensity, "carbon intensity");

}

void validateBatterySpec(const BatterySpec& battery) {

  requireFinite(battery.capacity_kwh, "capacity");
  requireFinite(battery.max_charge_kw, "max charge power");
  requireFinite(battery.max_discharge_kw, "max discharge power");
  requireFinite(battery.efficiency, "round-trip efficiency");
  requireFinite(battery.initial_energy_kwh, "initial energy");
  requireFinite(battery.reserve_energy_kwh, "reserve energy");

  if (battery.capacity_kwh < 0) {
    throw InvalidInputError("capacity must be >= 0 (" + describe("capacity", battery.capacity_kwh) + ")");
  }

  if (!(battery.efficiency > 0 && battery.efficiency <= 1)) {
    throw InvalidInputError("round-trip efficiency must be in (0, 1] (" +
                            describe("efficiency", battery.efficiency) + ")");
  }

  if (battery.max_charge_kw < 0) {
    throw InvalidInputError("max charge power must be >= 0 (" +
                            describe("max charge", battery.max_charge_kw) + ")");
  }

  if (battery.max_discharge_kw < 0) {
    throw InvalidInputError("max discharge power must be >= 0 (" +
                            describe("max discharge", battery.max_discharge_kw) + ")");
  }

  if (battery.reserve_energy_kwh < 0 || battery.reserve_energy_kwh > battery.capacity_kwh) {
    throw InvalidInputError("reserve energy must be within [0, capacity] (" +
                            describe("reserve", battery.reserve_energy_kwh) + ")");
  }

  if (battery.initial_energy_kwh < battery.reserve_energy_kwh ||
      battery.initial_energy_kwh > battery.capacity_kwh) {
    throw InvalidInputError("initial energy must be within [reserve, capacity] (" +
                            describe("initial energy", battery.initial_energy_kwh) + ", " +
                            describe("capacity", battery.capacity_kwh) + ")");
  }

}

void validateScheduleOptions(const ScheduleOptions& options, const BatterySpec& battery) {

  if (!(std::isfinite(options.timestep_hours) && options.timestep_hours > 0)) {
    throw InvalidInputError("timestep duration must be a positive number of hours (" +
                            describe("timestep hours", options.timestep_hours) + ")");
  }

  // final bounds may be infinite but never NaN
  if (std::isnan(options.min_final_energy_kwh) || std::isnan(options.max_final_energy_kwh)) {
    throw InvalidInputError("final energy bounds must not be NaN");
  }

  if (options.min_final_energy_kwh > options.max_final_energy_kwh) {
    throw InvalidInputError("min final energy must not exceed max final energy (" +
                            describe("min final", options.min_final_energy_kwh) + ", " +
                            describe("max final", options.max_final_energy_kwh) + ")");
  }

  if (options.min_final_energy_kwh > battery.capacity_kwh) {
    throw InvalidInputError("min final energy must not exceed capacity (" +
                            describe("min final", options.min_final_energy_kwh) + ")");
  }

  if (options.max_final_energy_kwh < battery.reserve_energy_kwh) {
    throw InvalidInputError("max final energy must not be below reserve energy (" +
                            describe("max final", options.max_final_energy_kwh) + ")");
  }

}

void validateScheduleInputs(const ProfileData& profile,
                            const BatterySpec& battery,
                            const ScheduleOptions& options) {

  validateProfileData(profile);
  validateBatterySpec(battery);
  validateScheduleOptions(options, battery);

}
