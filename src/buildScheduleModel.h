// linear program describing power flow through the battery over the horizon

#ifndef BATTERYSCHEDULEENGINE_BUILDSCHEDULEMODEL_H
#define BATTERYSCHEDULEENGINE_BUILDSCHEDULEMODEL_H

#include "scheduleTypes.h"

// column and row positions of the schedule model
//
// columns: charge, discharge home, discharge grid, grid home (N each), energy (N+1)
// rows:    energy balance, demand balance, discharge limit (N each)
struct ScheduleModelLayout {
  arma::uword num_steps            = 0;
  arma::uword num_columns          = 0;
  arma::uword num_rows             = 0;

  arma::uword pos_charge           = 0;
  arma::uword pos_discharge_home   = 0;
  arma::uword pos_discharge_grid   = 0;
  arma::uword pos_grid_home        = 0;
  arma::uword pos_energy           = 0;

  arma::uword row_energy_balance   = 0;
  arma::uword row_demand_balance   = 0;
  arma::uword row_discharge_limit  = 0;

  arma::uword charge(arma::uword t) const          { return pos_charge + t; }
  arma::uword dischargeHome(arma::uword t) const   { return pos_discharge_home + t; }
  arma::uword dischargeGrid(arma::uword t) const   { return pos_discharge_grid + t; }
  arma::uword gridHome(arma::uword t) const        { return pos_grid_home + t; }
  arma::uword energy(arma::uword t) const          { return pos_energy + t; }
};

ScheduleModelLayout scheduleModelLayout(arma::uword num_steps);

// minimize Objective' x  subject to  RowLower <= Constraints x <= RowUpper,
//                                    ColumnLower <= x <= ColumnUpper
// infinite bounds are stored as +/- arma::datum::inf
struct LinearProgram {
  ScheduleModelLayout layout;

  arma::vec ColumnLower;
  arma::vec ColumnUpper;
  arma::vec Objective;

  arma::sp_mat Constraints;
  arma::vec RowLower;
  arma::vec RowUpper;
};

// feasible region only, the objective is left at zero and does not depend on the mode
LinearProgram buildScheduleModel(const ProfileData& profile,
                                 const BatterySpec& battery,
                                 const ScheduleOptions& options);

#endif
