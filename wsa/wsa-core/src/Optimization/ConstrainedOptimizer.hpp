#ifndef WSA_CORE_OPTIMIZATION_CONSTRAINED_OPTIMIZER_HPP
#define WSA_CORE_OPTIMIZATION_CONSTRAINED_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <functional>
#include <limits>
#include <string>
#include <vector>

namespace wsa_core
{

/**
 * @brief Smooth constrained minimization problem
 *
 *   minimize    f(x)
 *   subject to  A x <= b
 *               g_j(x) <= 0   for every j
 *
 * Functions return their value and, when gradient is non-null, write the
 * gradient (same size as x) into it.
 */
struct ConstrainedProblem
{
  using Function =
    std::function<double(const Eigen::VectorXd& x, Eigen::VectorXd* gradient)>;

  Function objective;
  Eigen::MatrixXd A;                     ///< Linear inequality matrix (may be empty)
  Eigen::VectorXd b;                     ///< Linear inequality RHS
  std::vector<Function> inequalities;    ///< Nonlinear g_j(x) <= 0
  Eigen::VectorXd initialGuess;
};

/// Result of a constrained minimization
struct OptimizationResult
{
  Eigen::VectorXd x;          ///< Best point found
  double objective{std::numeric_limits<double>::quiet_NaN()};
  bool converged{false};      ///< Optimizer reported success and x is feasible
  int status{0};              ///< Backend status code
  int evaluations{0};         ///< Objective evaluations performed
  double maxViolation{std::numeric_limits<double>::quiet_NaN()};  ///< max(0, constraints) at x
  std::string message;
};

/**
 * @brief Nonlinear constrained-optimization capability used by the
 * max-radius sphere mode.
 *
 * Backend failures (non-convergence, infeasibility, exceptions raised by the
 * library) are returned with converged == false. Malformed problems are
 * thrown as std::invalid_argument.
 */
class ConstrainedOptimizer
{
public:
  virtual ~ConstrainedOptimizer() = default;

  [[nodiscard]] virtual OptimizationResult minimize(
    const ConstrainedProblem& problem) const = 0;

protected:
  ConstrainedOptimizer() = default;
  ConstrainedOptimizer(const ConstrainedOptimizer&) = default;
  ConstrainedOptimizer& operator=(const ConstrainedOptimizer&) = default;
  ConstrainedOptimizer(ConstrainedOptimizer&&) noexcept = default;
  ConstrainedOptimizer& operator=(ConstrainedOptimizer&&) noexcept = default;
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_CONSTRAINED_OPTIMIZER_HPP
