// solves the schedule linear program with COIN-OR Clp

#include "solveLinearProgram.h"

#include <coin/ClpSimplex.hpp>
#include <coin/CoinError.hpp>
#include <coin/CoinFinite.hpp>
#include <coin/CoinPackedMatrix.hpp>

#include <sstream>
#include <vector>

namespace {

// Clp treats +/- COIN_DBL_MAX as infinite
std::vector<double> toCoinBounds(const arma::vec& Bounds) {

  std::vector<double> Out(Bounds.n_elem);

  for (arma::uword i = 0; i < Bounds.n_elem; ++i) {
    if (Bounds(i) == arma::datum::inf) {
      Out[i] = COIN_DBL_MAX;
    } else if (Bounds(i) == -arma::datum::inf) {
      Out[i] = -COIN_DBL_MAX;
    } else {
      Out[i] = Bounds(i);
    }
  }

  return(Out);

}

std::string describeClpStatus(const ClpSimplex& clp) {
  std::ostringstream out;
  out << "Clp status " << clp.status() << ", secondary status " << clp.secondaryStatus();
  if (clp.isIterationLimitReached()) {
    out << " (iteration or time limit reached)";
  } else if (clp.isAbandoned()) {
    out << " (abandoned, numerical difficulties)";
  }
  return(out.str());
}

}

std::string solveStatusName(SolveStatus status) {

  switch (status) {
  case SolveStatus::Optimal:
    return("Optimal");
  case SolveStatus::Infeasible:
    return("Infeasible");
  case SolveStatus::Unbounded:
    return("Unbounded");
  case SolveStatus::SolverError:
    return("SolverError");
  }

  return("Unknown");

}

LinearProgramSolution solveLinearProgram(const LinearProgram& model,
                                         const SolverSettings& settings) {

  LinearProgramSolution solution;

  int num_rows    = static_cast<int>(model.Constraints.n_rows);
  int num_columns = static_cast<int>(model.Constraints.n_cols);


  //////// Convert Constraint Matrix ////////


  std::vector<int> RowIndex;
  std::vector<int> ColumnIndex;
  std::vector<double> Elements;

  RowIndex.reserve(model.Constraints.n_nonzero);
  ColumnIndex.reserve(model.Constraints.n_nonzero);
  Elements.reserve(model.Constraints.n_nonzero);

  for (arma::sp_mat::const_iterator it = model.Constraints.begin(); it != model.Constraints.end(); ++it) {
    RowIndex.push_back(static_cast<int>(it.row()));
    ColumnIndex.push_back(static_cast<int>(it.col()));
    Elements.push_back(*it);
  }

  std::vector<double> ColumnLower = toCoinBounds(model.ColumnLower);
  std::vector<double> ColumnUpper = toCoinBounds(model.ColumnUpper);
  std::vector<double> RowLower    = toCoinBounds(model.RowLower);
  std::vector<double> RowUpper    = toCoinBounds(model.RowUpper);
  std::vector<double> Objective(model.Objective.begin(), model.Objective.end());


  //////// Solve ////////


  ClpSimplex clp;

  try {

    CoinPackedMatrix matrix(true, RowIndex.data(), ColumnIndex.data(), Elements.data(),
                            static_cast<CoinBigIndex>(Elements.size()));
    matrix.setDimensions(num_rows, num_columns);

    clp.setLogLevel(settings.log_level);
    clp.loadProblem(matrix,
                    ColumnLower.data(), ColumnUpper.data(), Objective.data(),
                    RowLower.data(), RowUpper.data());

    // minimize
    clp.setOptimizationDirection(1.0);

    if (settings.max_seconds > 0) {
      clp.setMaximumSeconds(settings.max_seconds);
    }

    clp.initialSolve();

  } catch (const CoinError& e) {

    solution.status  = SolveStatus::SolverError;
    solution.message = "Clp failed in " + e.className() + "::" + e.methodName() + ": " + e.message();
    return(solution);

  }

  solution.solver_status    = clp.status();
  solution.secondary_status = clp.secondaryStatus();
  solution.num_iterations   = clp.numberIterations();


  //////// Map Status ////////


  if (clp.isProvenOptimal()) {

    solution.status          = SolveStatus::Optimal;
    solution.objective_value = clp.objectiveValue();
    solution.Values          = arma::vec(clp.primalColumnSolution(), static_cast<arma::uword>(num_columns));

  } else if (clp.isProvenPrimalInfeasible()) {

    solution.status  = SolveStatus::Infeasible;
    solution.message = "no schedule satisfies the energy, rate and demand constraints (" +
                       describeClpStatus(clp) + ")";

  } else if (clp.isProvenDualInfeasible()) {

    solution.status  = SolveStatus::Unbounded;
    solution.message = "objective can decrease without limit (" + describeClpStatus(clp) + ")";

  } else {

    solution.status  = SolveStatus::SolverError;
    solution.message = describeClpStatus(clp);

  }

  return(solution);

}
