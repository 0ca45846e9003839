/*
 * ============================================================================
 * BATTERY SCHEDULE ENGINE - SOLVER ADAPTER TESTS
 * ============================================================================
 *
 * Clp status mapping on small hand-built programs, and the errors raised for
 * solutions that are not optimal
 *
 * ============================================================================
 */

#undef NDEBUG

#include "extractSchedule.h"
#include "runScheduleOptimization.h"
#include "scheduleErrors.h"
#include "solveLinearProgram.h"
#include "testFixtures.h"

#include <cassert>
#include <iostream>

namespace {

// one column x, one row x >= row_lower, minimize objective * x
LinearProgram singleColumnProgram(double objective, double row_lower, double column_upper) {

  LinearProgram model;

  model.ColumnLower = arma::zeros<arma::vec>(1);
  model.ColumnUpper = arma::vec(1);
  model.ColumnUpper(0) = column_upper;
  model.Objective   = arma::vec(1);
  model.Objective(0) = objective;

  model.Constraints = arma::sp_mat(1, 1);
  model.Constraints(0, 0) = 1.0;

  model.RowLower = arma::vec(1);
  model.RowLower(0) = row_lower;
  model.RowUpper = arma::vec(1);
  model.RowUpper(0) = arma::datum::inf;

  return model;
}

LinearProgramSolution solutionWithStatus(SolveStatus status) {
  LinearProgramSolution solution;
  solution.status  = status;
  solution.message = "status " + solveStatusName(status);
  return solution;
}

}

bool test_optimal_single_column() {
  std::cout << "Testing optimal single column program..." << std::flush;

  LinearProgram model = singleColumnProgram(2.0, 1.5, 10.0);
  LinearProgramSolution solution = solveLinearProgram(model, SolverSettings());

  assert(solution.status == SolveStatus::Optimal);
  assert(solution.Values.n_elem == 1);
  assert(near(solution.Values(0), 1.5));
  assert(near(solution.objective_value, 3.0));

  std::cout << " PASS\n";
  return true;
}

bool test_unbounded_program() {
  std::cout << "Testing unbounded program..." << std::flush;

  // x can grow without limit while the objective keeps falling
  LinearProgram model = singleColumnProgram(-1.0, 1.0, arma::datum::inf);
  LinearProgramSolution solution = solveLinearProgram(model, SolverSettings());

  assert(solution.status == SolveStatus::Unbounded);
  assert(solution.Values.is_empty());
  assert(!solution.message.empty());

  std::cout << " PASS\n";
  return true;
}

bool test_infeasible_program() {
  std::cout << "Testing infeasible program..." << std::flush;

  // x <= 1 against x >= 5
  LinearProgram model = singleColumnProgram(1.0, 5.0, 1.0);
  LinearProgramSolution solution = solveLinearProgram(model, SolverSettings());

  assert(solution.status == SolveStatus::Infeasible);
  assert(solution.Values.is_empty());

  std::cout << " PASS\n";
  return true;
}

bool test_status_to_error() {
  std::cout << "Testing solve status to error mapping..." << std::flush;

  requireOptimalSolution(solutionWithStatus(SolveStatus::Optimal));

  assert(throwsError<InfeasibleModelError>([]() {
    requireOptimalSolution(solutionWithStatus(SolveStatus::Infeasible));
  }));
  assert(throwsError<UnboundedModelError>([]() {
    requireOptimalSolution(solutionWithStatus(SolveStatus::Unbounded));
  }));
  assert(throwsError<SolverError>([]() {
    requireOptimalSolution(solutionWithStatus(SolveStatus::SolverError));
  }));

  // the solver message is kept after the category prefix
  try {
    requireOptimalSolution(solutionWithStatus(SolveStatus::Unbounded));
    assert(false);
  } catch (const UnboundedModelError& e) {
    assert(std::string(e.what()) == "unbounded model: status Unbounded");
  }

  std::cout << " PASS\n";
  return true;
}

bool test_no_schedule_from_failed_solve() {
  std::cout << "Testing no schedule is read from a failed solve..." << std::flush;

  ProfileData profile = makeProfile(values({0.1, 0.3}), values({0.0, 0.0}),
                                    values({1.0, 1.0}), values({100.0, 100.0}));
  BatterySpec battery = makeBattery(10.0, 5.0, 5.0, 1.0, 0.0);
  LinearProgram model = buildScheduleModel(profile, battery, ScheduleOptions());

  // values present but the status is not Optimal
  LinearProgramSolution failed = solutionWithStatus(SolveStatus::SolverError);
  failed.Values = arma::zeros<arma::vec>(model.layout.num_columns);
  assert(throwsError<SolverError>([&]() { extractSchedule(model, failed, battery, 1.0); }));

  LinearProgramSolution infeasible = solutionWithStatus(SolveStatus::Infeasible);
  assert(throwsError<SolverError>([&]() { extractSchedule(model, infeasible, battery, 1.0); }));

  // optimal status with a value vector of the wrong size
  LinearProgramSolution truncated = solutionWithStatus(SolveStatus::Optimal);
  truncated.Values = arma::zeros<arma::vec>(model.layout.num_columns - 1);
  assert(throwsError<SolverError>([&]() { extractSchedule(model, truncated, battery, 1.0); }));

  std::cout << " PASS\n";
  return true;
}

int main() {
  std::cout << "============================================================================\n";
  std::cout << "BATTERY SCHEDULE SOLVER ADAPTER TESTS\n";
  std::cout << "============================================================================\n\n";

  try {
    bool all_passed = true;

    all_passed &= test_optimal_single_column();
    all_passed &= test_unbounded_program();
    all_passed &= test_infeasible_program();
    all_passed &= test_status_to_error();
    all_passed &= test_no_schedule_from_failed_solve();

    std::cout << "\n============================================================================\n";
    if (all_passed) {
      std::cout << "All solver adapter tests PASSED\n";
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
