/*
 * ============================================================================
 * BATTERY SCHEDULE ENGINE - SAVINGS TESTS
 * ============================================================================
 *
 * Cost and carbon totals for schedules and for the home without a battery
 *
 * ============================================================================
 */

#undef NDEBUG

#include "calculateSavings.h"
#include "extractSchedule.h"
#include "testFixtures.h"

#include <cassert>
#include <iostream>

namespace {

ProfileData sampleProfile() {
  return makeProfile(values({0.2, 0.4, 0.1}), values({0.05, 0.3, 0.0}),
                     values({2.0, 1.0, 3.0}), values({250.0, 400.0, 100.0}));
}

// battery idle, every kWh of demand bought from the grid
Schedule idleSchedule(const ProfileData& profile) {
  arma::uword num_steps = profile.Demand.n_elem;

  Schedule schedule;
  schedule.Charge        = arma::zeros<arma::vec>(num_steps);
  schedule.DischargeHome = arma::zeros<arma::vec>(num_steps);
  schedule.DischargeGrid = arma::zeros<arma::vec>(num_steps);
  schedule.GridHome      = profile.Demand;
  schedule.Energy        = arma::zeros<arma::vec>(num_steps + 1);
  return schedule;
}

}

bool test_baseline_totals() {
  std::cout << "Testing baseline totals..." << std::flush;

  ProfileData profile = sampleProfile();

  // 2*0.2 + 1*0.4 + 3*0.1, and 2*250 + 1*400 + 3*100 grams (no kg conversion)
  assert(near(baselineCost(profile, 1.0), 1.1));
  assert(near(baselineCarbon(profile, 1.0), 1200.0));

  // totals scale with the timestep duration
  assert(near(baselineCost(profile, 0.5), 0.55));
  assert(near(baselineCarbon(profile, 0.25), 300.0));

  std::cout << " PASS\n";
  return true;
}

bool test_idle_schedule_saves_nothing() {
  std::cout << "Testing idle schedule saves nothing..." << std::flush;

  ProfileData profile = sampleProfile();
  SavingsReport report = calculateSavings(profile, idleSchedule(profile), 1.0);

  assert(near(report.cost_savings, 0.0));
  assert(near(report.carbon_savings, 0.0));
  assert(near(report.optimized_cost, report.baseline_cost));

  std::cout << " PASS\n";
  return true;
}

bool test_export_credit_is_cost_only() {
  std::cout << "Testing export credit applies to cost only..." << std::flush;

  ProfileData profile = sampleProfile();
  Schedule schedule = idleSchedule(profile);

  // 2 kW exported in the second hour from a battery that started with energy
  schedule.DischargeGrid(1) = 2.0;
  schedule.Energy = recomputeEnergy(schedule.Charge, schedule.DischargeHome, schedule.DischargeGrid,
                                    5.0, 1.0, 1.0);

  SavingsReport report = calculateSavings(profile, schedule, 1.0);

  assert(near(report.cost_savings, 0.6));
  assert(near(report.carbon_savings, 0.0));
  assert(near(schedule.Energy(3), 3.0));

  std::cout << " PASS\n";
  return true;
}

bool test_negative_savings_reported() {
  std::cout << "Testing negative savings are reported..." << std::flush;

  ProfileData profile = sampleProfile();
  Schedule schedule = idleSchedule(profile);

  // charging in the expensive hour without using the energy
  schedule.Charge(1) = 1.5;

  SavingsReport report = calculateSavings(profile, schedule, 1.0);

  assert(near(report.cost_savings, -0.6));
  assert(near(report.carbon_savings, -600.0));

  // the baseline does not depend on the schedule
  assert(near(report.baseline_cost, baselineCost(profile, 1.0)));
  assert(near(report.baseline_carbon, baselineCarbon(profile, 1.0)));

  std::cout << " PASS\n";
  return true;
}

bool test_energy_recomputed_with_efficiency() {
  std::cout << "Testing energy path with charging efficiency..." << std::flush;

  arma::vec Charge        = values({4.0, 0.0, 0.0});
  arma::vec DischargeHome = values({0.0, 1.0, 0.0});
  arma::vec DischargeGrid = values({0.0, 0.0, 2.0});

  arma::vec Energy = recomputeEnergy(Charge, DischargeHome, DischargeGrid, 1.0, 0.9, 0.5);

  assert(Energy.n_elem == 4);
  assert(near(Energy(0), 1.0));
  assert(near(Energy(1), 2.8));
  assert(near(Energy(2), 2.3));
  assert(near(Energy(3), 1.3));

  std::cout << " PASS\n";
  return true;
}

int main() {
  std::cout << "============================================================================\n";
  std::cout << "BATTERY SCHEDULE SAVINGS TESTS\n";
  std::cout << "============================================================================\n\n";

  try {
    bool all_passed = true;

    all_passed &= test_baseline_totals();
    all_passed &= test_idle_schedule_saves_nothing();
    all_passed &= test_export_credit_is_cost_only();
    all_passed &= test_negative_savings_reported();
    all_passed &= test_energy_recomputed_with_efficiency();

    std::cout << "\n============================================================================\n";
    if (all_passed) {
      std::cout << "All savings tests PASSED\n";
    } else {
      std::cout << "Some tests FAILED\n";
      return 1;
    }
    std::cout << "============================================================================\n";

  } catch (const std::exception& e) {
    std::cerr << "\nError: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
