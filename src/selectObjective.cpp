// builds objective coefficients for the active optimization mode

#include "selectObjective.h"

arma::vec selectObjective(const ScheduleModelLayout& layout,
                          const ProfileData& profile,
                          OptimizationMode mode,
                          double timestep_hours) {

  double dt = timestep_hours;

  // energy columns carry no cost
  arma::vec Objective = arma::zeros<arma::vec>(layout.num_columns);

  for (arma::uword t = 0; t < layout.num_steps; ++t) {

    if (mode == OptimizationMode::Cost) {

      Objective(layout.gridHome(t))      =  profile.ImportTariff(t) * dt;
      Objective(layout.charge(t))        =  profile.ImportTariff(t) * dt;
      Objective(layout.dischargeGrid(t)) = -profile.ExportTariff(t) * dt;

    } else {

      Objective(layout.gridHome(t))      =  profile.CarbonIntensity(t) * dt;
      Objective(layout.charge(t))        =  profile.CarbonIntensity(t) * dt;

    }

  }

  return(Objective);

}
