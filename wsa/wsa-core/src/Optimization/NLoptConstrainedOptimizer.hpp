// Ticket: 0005_max_radius_sphere_nlopt

#ifndef WSA_CORE_OPTIMIZATION_NLOPT_CONSTRAINED_OPTIMIZER_HPP
#define WSA_CORE_OPTIMIZATION_NLOPT_CONSTRAINED_OPTIMIZER_HPP

#include <vector>

#include "wsa-core/src/Optimization/ConstrainedOptimizer.hpp"

namespace wsa_core
{

/**
 * @brief ConstrainedOptimizer backed by NLopt
 *
 * Uses NLopt's SLSQP (Sequential Quadratic Programming) by default. The
 * linear inequalities A x <= b are registered as one vector-valued
 * constraint; every nonlinear g_j(x) <= 0 is registered separately.
 *
 * A run counts as converged when NLopt returns SUCCESS, FTOL_REACHED or
 * XTOL_REACHED and the final point violates no constraint by more than the
 * feasibility tolerance. MAXTIME_REACHED (see setMaxTime) gives a
 * non-converged result, which lets callers bound the solve time.
 *
 * @ticket 0005_max_radius_sphere_nlopt
 */
class NLoptConstrainedOptimizer : public ConstrainedOptimizer
{
public:
  /// Algorithm selection for NLopt
  enum class Algorithm
  {
    SLSQP,  ///< Sequential Quadratic Programming (gradient-based, default)
    COBYLA  ///< Constrained Optimization BY Linear Approximation (derivative-free)
  };

  /**
   * @brief Construct with default settings (SLSQP, 1e-8 tolerance,
   * 500 evaluations, no time limit)
   */
  NLoptConstrainedOptimizer();

  explicit NLoptConstrainedOptimizer(Algorithm algo);

  ~NLoptConstrainedOptimizer() override = default;

  /**
   * @throws std::invalid_argument if the objective is missing, the initial
   *         guess is empty, or A/b do not match the problem dimension
   */
  [[nodiscard]] OptimizationResult minimize(
    const ConstrainedProblem& problem) const override;

  /// Set relative convergence tolerance (default: 1e-8)
  void setTolerance(double tol) { tolerance_ = tol; }

  /// Set constraint feasibility tolerance (default: 1e-6)
  void setFeasibilityTolerance(double tol) { feasibility_tolerance_ = tol; }

  /// Set maximum objective evaluations (default: 500)
  void setMaxEvaluations(int n) { max_evaluations_ = n; }

  /// Set wall-clock limit in seconds, 0 disables (default: 0)
  void setMaxTime(double seconds) { max_time_ = seconds; }

  /// Set NLopt algorithm (default: SLSQP)
  void setAlgorithm(Algorithm algo) { algorithm_ = algo; }

  [[nodiscard]] double getTolerance() const { return tolerance_; }
  [[nodiscard]] double getFeasibilityTolerance() const { return feasibility_tolerance_; }
  [[nodiscard]] int getMaxEvaluations() const { return max_evaluations_; }
  [[nodiscard]] double getMaxTime() const { return max_time_; }
  [[nodiscard]] Algorithm getAlgorithm() const { return algorithm_; }

  // Rule of Zero: compiler-generated special members
  NLoptConstrainedOptimizer(const NLoptConstrainedOptimizer&) = default;
  NLoptConstrainedOptimizer& operator=(const NLoptConstrainedOptimizer&) = default;
  NLoptConstrainedOptimizer(NLoptConstrainedOptimizer&&) noexcept = default;
  NLoptConstrainedOptimizer& operator=(NLoptConstrainedOptimizer&&) noexcept = default;

private:
  /// Scalar callback for the objective and each nonlinear constraint
  static double scalarFunction(const std::vector<double>& x,
                               std::vector<double>& grad,
                               void* data);

  /**
   * @brief Vector callback for A x - b <= 0
   *
   * @param m Number of rows of A
   * @param result Output constraint values (m)
   * @param n Problem dimension
   * @param x Current iterate (n)
   * @param gradient Output Jacobian, row-major m x n (may be null)
   * @param data Pointer to LinearData
   */
  static void linearConstraints(unsigned m,
                                double* result,
                                unsigned n,
                                const double* x,
                                double* gradient,
                                void* data);

  /// Largest positive constraint value of the problem at x
  static double maxViolation(const ConstrainedProblem& problem,
                             const Eigen::VectorXd& x);

  /// Data passed to scalar callbacks
  struct FunctionData
  {
    const ConstrainedProblem::Function* function;
    int* evaluations;  ///< Incremented per call when non-null
  };

  /// Data passed to the linear constraint callback
  struct LinearData
  {
    const Eigen::MatrixXd* A;
    const Eigen::VectorXd* b;
  };

  double tolerance_{1e-8};
  double feasibility_tolerance_{1e-6};
  int max_evaluations_{500};
  double max_time_{0.0};
  Algorithm algorithm_{Algorithm::SLSQP};
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_NLOPT_CONSTRAINED_OPTIMIZER_HPP
