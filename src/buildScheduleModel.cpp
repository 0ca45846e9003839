// builds the linear program for battery schedule optimization

// one set of flow variables per timestep plus the battery energy at each timestep boundary,
// tied together by the energy balance recurrence

#include "buildScheduleModel.h"

#include <algorithm>

ScheduleModelLayout scheduleModelLayout(arma::uword num_steps) {

  ScheduleModelLayout layout;

  layout.num_steps            = num_steps;

  layout.pos_charge           = 0;
  layout.pos_discharge_home   = num_steps;
  layout.pos_discharge_grid   = num_steps * 2;
  layout.pos_grid_home        = num_steps * 3;
  layout.pos_energy           = num_steps * 4;
  layout.num_columns          = num_steps * 5 + 1;

  layout.row_energy_balance   = 0;
  layout.row_demand_balance   = num_steps;
  layout.row_discharge_limit  = num_steps * 2;
  layout.num_rows             = num_steps * 3;

  return(layout);

}

LinearProgram buildScheduleModel(const ProfileData& profile,
                                 const BatterySpec& battery,
                                 const ScheduleOptions& options) {


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Process Inputs                                                                               //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  // battery parameters
  double capacity              = battery.capacity_kwh;
  double max_charge            = battery.max_charge_kw;
  double max_discharge         = battery.max_discharge_kw;
  double efficiency            = battery.efficiency;
  double initial_energy        = battery.initial_energy_kwh;
  double reserve_energy        = battery.reserve_energy_kwh;

  // hours per timestep
  double dt                    = options.timestep_hours;

  // dimensions
  arma::uword num_steps        = profile.Demand.n_elem;

  LinearProgram model;
  model.layout                 = scheduleModelLayout(num_steps);

  const ScheduleModelLayout& layout = model.layout;

  double inf                   = arma::datum::inf;


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Column Bounds                                                                                //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  model.ColumnLower            = arma::zeros<arma::vec>(layout.num_columns);
  model.ColumnUpper            = arma::zeros<arma::vec>(layout.num_columns);
  model.Objective              = arma::zeros<arma::vec>(layout.num_columns);

  for (arma::uword t = 0; t < num_steps; ++t) {

    // rated power limits
    model.ColumnUpper(layout.charge(t))          = max_charge;
    model.ColumnUpper(layout.dischargeHome(t))   = max_discharge;
    model.ColumnUpper(layout.dischargeGrid(t))   = max_discharge;

    // grid supply to the home is limited only by demand
    model.ColumnUpper(layout.gridHome(t))        = inf;

  }

  // usable energy window
  for (arma::uword t = 0; t <= num_steps; ++t) {
    model.ColumnLower(layout.energy(t)) = reserve_energy;
    model.ColumnUpper(layout.energy(t)) = capacity;
  }

  // initial energy is fixed
  model.ColumnLower(layout.energy(0)) = initial_energy;
  model.ColumnUpper(layout.energy(0)) = initial_energy;

  // optional window on energy left at the end of the horizon
  model.ColumnLower(layout.energy(num_steps)) = std::max(reserve_energy, options.min_final_energy_kwh);
  model.ColumnUpper(layout.energy(num_steps)) = std::min(capacity, options.max_final_energy_kwh);


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Constraint Matrix                                                                            //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  // 5 entries per energy balance row, 2 per demand balance and discharge limit row
  arma::uword num_entries      = num_steps * 9;

  arma::umat Locations(2, num_entries);
  arma::vec Values(num_entries);

  model.RowLower               = arma::zeros<arma::vec>(layout.num_rows);
  model.RowUpper               = arma::zeros<arma::vec>(layout.num_rows);

  arma::uword entry = 0;

  // helper to append one coefficient
  auto add = [&](arma::uword row, arma::uword col, double value) {
    Locations(0, entry) = row;
    Locations(1, entry) = col;
    Values(entry)       = value;
    ++entry;
  };

  for (arma::uword t = 0; t < num_steps; ++t) {

    // energy(t+1) - energy(t) - eff * dt * charge(t) + dt * (discharge_home(t) + discharge_grid(t)) = 0
    arma::uword r_energy = layout.row_energy_balance + t;

    add(r_energy, layout.energy(t+1),        1.0);
    add(r_energy, layout.energy(t),         -1.0);
    add(r_energy, layout.charge(t),         -efficiency * dt);
    add(r_energy, layout.dischargeHome(t),   dt);
    add(r_energy, layout.dischargeGrid(t),   dt);

    model.RowLower(r_energy) = 0;
    model.RowUpper(r_energy) = 0;

    // home demand is met exactly by grid and battery
    arma::uword r_demand = layout.row_demand_balance + t;

    add(r_demand, layout.gridHome(t),        1.0);
    add(r_demand, layout.dischargeHome(t),   1.0);

    model.RowLower(r_demand) = profile.Demand(t);
    model.RowUpper(r_demand) = profile.Demand(t);

    // combined discharge cannot exceed the rated discharge power
    arma::uword r_discharge = layout.row_discharge_limit + t;

    add(r_discharge, layout.dischargeHome(t), 1.0);
    add(r_discharge, layout.dischargeGrid(t), 1.0);

    model.RowLower(r_discharge) = -inf;
    model.RowUpper(r_discharge) = max_discharge;

  }

  model.Constraints = arma::sp_mat(Locations, Values, layout.num_rows, layout.num_columns);

  return(model);

}
