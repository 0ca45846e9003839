// Rcpp engine for optimizing home battery schedules

// solves one linear program over the supplied horizon, minimizing either energy cost or carbon
// emissions, and reports savings against a home without a battery

#include <RcppArmadillo.h>

#include "rcppScheduleInputs.h"
#include "runScheduleOptimization.h"

using namespace Rcpp;

// [[Rcpp::depends(RcppArmadillo)]]
// [[Rcpp::export]]
List optimizeBatterySchedule(DataFrame Profiles,
                             DataFrame BatteryData,
                             List OptParameters) {


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Process Inputs                                                                               //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  ProfileData profile      = readProfileData(Profiles);
  BatterySpec battery      = readBatterySpec(BatteryData);
  ScheduleOptions options  = readScheduleOptions(OptParameters);


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Run Optimization Model                                                                       //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  // errors propagate to R, no schedule is returned for a failed run
  ScheduleResult result    = runScheduleOptimization(profile, battery, options);


  //////////////////////////////////////////////////////////////////////////////////////////////////
  //                                                                                              //
  // Return Results                                                                               //
  //                                                                                              //
  //////////////////////////////////////////////////////////////////////////////////////////////////


  List Out;

  addSchedule(Out, result.schedule);
  addSavings(Out, result.savings);

  Out["Mode"]              = optimizationModeName(result.mode);
  Out["Status"]            = "Optimal";
  Out["ObjectiveValue"]    = result.objective_value;
  Out["NumIterations"]     = result.num_iterations;

  return(Out);

}
