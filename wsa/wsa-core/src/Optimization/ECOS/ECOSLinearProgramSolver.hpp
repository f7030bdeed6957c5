// Ticket: 0004_chebyshev_center_ecos

#ifndef WSA_CORE_OPTIMIZATION_ECOS_ECOS_LINEAR_PROGRAM_SOLVER_HPP
#define WSA_CORE_OPTIMIZATION_ECOS_ECOS_LINEAR_PROGRAM_SOLVER_HPP

#include <Eigen/Dense>

#include "wsa-core/src/Optimization/ECOS/ECOSData.hpp"
#include "wsa-core/src/Optimization/LinearProgramSolver.hpp"

namespace wsa_core
{

/**
 * @brief LinearProgramSolver backed by the ECOS interior-point solver.
 *
 * Each solve() builds its own ECOSData, so one instance may be shared across
 * threads. Only ECOS_OPTIMAL counts as converged; infeasibility, unbounded
 * problems, iteration limits and numerical trouble return converged == false
 * with the ECOS exit flag and a message.
 */
class ECOSLinearProgramSolver : public LinearProgramSolver
{
public:
  /// @brief ECOS solver settings
  struct Config
  {
    int maxIterations{100};      ///< ECOS maxit
    double absTolerance{1e-8};   ///< ECOS abstol
    double relTolerance{1e-8};   ///< ECOS reltol
    double feasTolerance{1e-8};  ///< ECOS feastol
  };

  ECOSLinearProgramSolver();
  explicit ECOSLinearProgramSolver(const Config& config);
  ~ECOSLinearProgramSolver() override = default;

  [[nodiscard]] LinearProgramResult solve(
    const Eigen::VectorXd& c,
    const Eigen::MatrixXd& G,
    const Eigen::VectorXd& h) const override;

  /**
   * @brief Run ECOS on fully populated problem data.
   *
   * Calls data.setup() if needed, applies the configured settings and solves.
   *
   * @throws std::runtime_error if ECOS_setup rejects the data
   */
  [[nodiscard]] LinearProgramResult solve(ECOSData& data) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  /// Human-readable description of an ECOS exit flag
  [[nodiscard]] static const char* describeExitFlag(idxint exitFlag);

  ECOSLinearProgramSolver(const ECOSLinearProgramSolver&) = default;
  ECOSLinearProgramSolver& operator=(const ECOSLinearProgramSolver&) = default;
  ECOSLinearProgramSolver(ECOSLinearProgramSolver&&) noexcept = default;
  ECOSLinearProgramSolver& operator=(ECOSLinearProgramSolver&&) noexcept =
    default;

private:
  Config config_;
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_ECOS_ECOS_LINEAR_PROGRAM_SOLVER_HPP
