#ifndef WSA_CORE_OPTIMIZATION_LINEAR_PROGRAM_SOLVER_HPP
#define WSA_CORE_OPTIMIZATION_LINEAR_PROGRAM_SOLVER_HPP

#include <Eigen/Dense>
#include <limits>
#include <string>

namespace wsa_core
{

/// Result of a linear program solve
struct LinearProgramResult
{
  Eigen::VectorXd x;         ///< Last iterate (optimal point if converged)
  double objective{std::numeric_limits<double>::quiet_NaN()};
  bool converged{false};     ///< True only for a certified optimum
  int exitFlag{0};           ///< Backend exit code
  int iterations{0};
  double primalResidual{std::numeric_limits<double>::quiet_NaN()};
  double dualResidual{std::numeric_limits<double>::quiet_NaN()};
  double gap{std::numeric_limits<double>::quiet_NaN()};
  std::string message;
};

/**
 * @brief Linear-programming capability used by the Chebyshev-center mode.
 *
 * Solves  min c^T x  s.t.  G x <= h.  Infeasible or unbounded problems and
 * numerical failures are reported with converged == false; malformed input
 * (mismatched dimensions) is thrown as std::invalid_argument.
 */
class LinearProgramSolver
{
public:
  virtual ~LinearProgramSolver() = default;

  /**
   * @param c Objective coefficients (n)
   * @param G Inequality matrix (m x n)
   * @param h Inequality right-hand side (m)
   */
  [[nodiscard]] virtual LinearProgramResult solve(
    const Eigen::VectorXd& c,
    const Eigen::MatrixXd& G,
    const Eigen::VectorXd& h) const = 0;

protected:
  LinearProgramSolver() = default;
  LinearProgramSolver(const LinearProgramSolver&) = default;
  LinearProgramSolver& operator=(const LinearProgramSolver&) = default;
  LinearProgramSolver(LinearProgramSolver&&) noexcept = default;
  LinearProgramSolver& operator=(LinearProgramSolver&&) noexcept = default;
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_LINEAR_PROGRAM_SOLVER_HPP
