// Ticket: 0005_max_radius_sphere_nlopt

#include "wsa-core/src/Optimization/NLoptConstrainedOptimizer.hpp"

#include <nlopt.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace wsa_core
{

namespace
{

const char* describeResult(nlopt::result result)
{
  switch (result)
  {
    case nlopt::SUCCESS:
      return "success";
    case nlopt::STOPVAL_REACHED:
      return "stopval reached";
    case nlopt::FTOL_REACHED:
      return "ftol reached";
    case nlopt::XTOL_REACHED:
      return "xtol reached";
    case nlopt::MAXEVAL_REACHED:
      return "maximum evaluations reached";
    case nlopt::MAXTIME_REACHED:
      return "maximum time reached";
    default:
      return "nlopt failure";
  }
}

}  // namespace

NLoptConstrainedOptimizer::NLoptConstrainedOptimizer() = default;

NLoptConstrainedOptimizer::NLoptConstrainedOptimizer(Algorithm algo)
  : algorithm_{algo}
{
}

OptimizationResult NLoptConstrainedOptimizer::minimize(
  const ConstrainedProblem& problem) const
{
  if (!problem.objective)
  {
    throw std::invalid_argument{
      "NLoptConstrainedOptimizer: problem has no objective"};
  }

  const Eigen::Index numVars = problem.initialGuess.size();
  if (numVars == 0)
  {
    throw std::invalid_argument{
      "NLoptConstrainedOptimizer: initial guess must be non-empty"};
  }

  const bool hasLinear = problem.A.rows() > 0;
  if (hasLinear &&
      (problem.A.cols() != numVars || problem.b.size() != problem.A.rows()))
  {
    std::ostringstream oss;
    oss << "NLoptConstrainedOptimizer: linear constraints are "
        << problem.A.rows() << "x" << problem.A.cols() << " with "
        << problem.b.size() << " bounds for a problem of dimension "
        << numVars;
    throw std::invalid_argument{oss.str()};
  }

  for (const auto& g : problem.inequalities)
  {
    if (!g)
    {
      throw std::invalid_argument{
        "NLoptConstrainedOptimizer: empty nonlinear constraint"};
    }
  }

  nlopt::algorithm nloptAlgo;
  switch (algorithm_)
  {
    case Algorithm::COBYLA:
      nloptAlgo = nlopt::LN_COBYLA;
      break;
    case Algorithm::SLSQP:
    default:
      nloptAlgo = nlopt::LD_SLSQP;
      break;
  }

  nlopt::opt opt{nloptAlgo, static_cast<unsigned>(numVars)};

  int evaluations = 0;
  FunctionData objectiveData{&problem.objective, &evaluations};
  opt.set_min_objective(scalarFunction, &objectiveData);

  LinearData linearData{&problem.A, &problem.b};
  if (hasLinear)
  {
    const std::vector<double> tol(static_cast<size_t>(problem.A.rows()),
                                  feasibility_tolerance_ * 1e-2);
    opt.add_inequality_mconstraint(linearConstraints, &linearData, tol);
  }

  // Storage must outlive optimize(); NLopt keeps raw pointers
  std::vector<FunctionData> constraintData;
  constraintData.reserve(problem.inequalities.size());
  for (const auto& g : problem.inequalities)
  {
    constraintData.push_back(FunctionData{&g, nullptr});
    opt.add_inequality_constraint(
      scalarFunction, &constraintData.back(), feasibility_tolerance_ * 1e-2);
  }

  opt.set_ftol_rel(tolerance_);
  opt.set_xtol_rel(tolerance_);
  opt.set_maxeval(max_evaluations_);
  if (max_time_ > 0.0)
  {
    opt.set_maxtime(max_time_);
  }

  std::vector<double> x(problem.initialGuess.data(),
                        problem.initialGuess.data() + numVars);

  OptimizationResult result;
  double finalObjective = std::numeric_limits<double>::quiet_NaN();
  nlopt::result status = nlopt::FAILURE;
  try
  {
    status = opt.optimize(x, finalObjective);
    result.message = describeResult(status);
  }
  catch (const std::exception& e)
  {
    // roundoff_limited, forced_stop and invalid_argument all land here
    result.message =
      std::string{"NLoptConstrainedOptimizer: optimization failed: "} +
      e.what();
  }

  result.x = Eigen::Map<const Eigen::VectorXd>(x.data(), numVars);
  result.objective = finalObjective;
  result.status = static_cast<int>(status);
  result.evaluations = evaluations;
  result.maxViolation = maxViolation(problem, result.x);

  const bool solverConverged = (status == nlopt::SUCCESS ||
                                status == nlopt::FTOL_REACHED ||
                                status == nlopt::XTOL_REACHED);
  const bool feasible = result.maxViolation <= feasibility_tolerance_;
  result.converged = solverConverged && feasible;

  if (solverConverged && !feasible)
  {
    result.message = "infeasible: constraint violation above tolerance";
  }

  if (!result.converged)
  {
    spdlog::warn(
      "NLoptConstrainedOptimizer: no converged solution ({}, max violation "
      "{:.3e}, {} evaluations)",
      result.message,
      result.maxViolation,
      result.evaluations);
  }

  return result;
}

double NLoptConstrainedOptimizer::scalarFunction(const std::vector<double>& x,
                                                 std::vector<double>& grad,
                                                 void* data)
{
  const auto* functionData = static_cast<const FunctionData*>(data);
  if (functionData->evaluations != nullptr)
  {
    ++(*functionData->evaluations);
  }

  const auto n = static_cast<Eigen::Index>(x.size());
  const Eigen::Map<const Eigen::VectorXd> xEigen{x.data(), n};

  if (grad.empty())
  {
    return (*functionData->function)(xEigen, nullptr);
  }

  Eigen::VectorXd gradEigen = Eigen::VectorXd::Zero(n);
  const double value = (*functionData->function)(xEigen, &gradEigen);
  std::copy(gradEigen.data(), gradEigen.data() + n, grad.begin());
  return value;
}

void NLoptConstrainedOptimizer::linearConstraints(unsigned m,
                                                  double* result,
                                                  unsigned n,
                                                  const double* x,
                                                  double* gradient,
                                                  void* data)
{
  const auto* linearData = static_cast<const LinearData*>(data);
  const Eigen::MatrixXd& A = *linearData->A;
  const Eigen::VectorXd& b = *linearData->b;

  const Eigen::Map<const Eigen::VectorXd> xEigen{x, static_cast<Eigen::Index>(n)};
  Eigen::Map<Eigen::VectorXd> values{result, static_cast<Eigen::Index>(m)};
  values = A * xEigen - b;

  if (gradient != nullptr)
  {
    // NLopt expects gradient[i * n + j] = dc_i / dx_j
    using RowMajorMatrix =
      Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    Eigen::Map<RowMajorMatrix> jacobian{
      gradient, static_cast<Eigen::Index>(m), static_cast<Eigen::Index>(n)};
    jacobian = A;
  }
}

double NLoptConstrainedOptimizer::maxViolation(const ConstrainedProblem& problem,
                                               const Eigen::VectorXd& x)
{
  double violation = 0.0;
  if (problem.A.rows() > 0)
  {
    violation = std::max(violation, (problem.A * x - problem.b).maxCoeff());
  }
  for (const auto& g : problem.inequalities)
  {
    violation = std::max(violation, g(x, nullptr));
  }
  return violation;
}

}  // namespace wsa_core
