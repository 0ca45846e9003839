// applies a signed power plan to the battery, clipping to rate and energy limits

#ifndef BATTERYSCHEDULEENGINE_SIMULATEBATTERY_H
#define BATTERYSCHEDULEENGINE_SIMULATEBATTERY_H

#include "scheduleTypes.h"

struct BatterySimulation {
  arma::vec ActualPower;   // kW delivered, + charge, - discharge (length N)
  arma::vec Energy;        // kWh at the start of each timestep (length N+1)
};

// PowerPlan is in kW, + charge and - discharge, and must have num_steps entries
// an empty plan is treated as all zero
BatterySimulation simulateBattery(const arma::vec& PowerPlan,
                                  arma::uword num_steps,
                                  const BatterySpec& battery,
                                  double timestep_hours);

#endif
