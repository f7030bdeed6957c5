// Ticket: 0004_chebyshev_center_ecos
// Ticket: 0005_max_radius_sphere_nlopt
// Ticket: 0006_coriolis_margin

#ifndef WSA_CORE_SPHERE_SPHERE_APPROXIMATOR_HPP
#define WSA_CORE_SPHERE_SPHERE_APPROXIMATOR_HPP

#include <Eigen/Dense>
#include <memory>

#include "wsa-core/src/Optimization/ConstrainedOptimizer.hpp"
#include "wsa-core/src/Optimization/LinearProgramSolver.hpp"
#include "wsa-core/src/Polytope/WrenchPolytope.hpp"
#include "wsa-core/src/Sphere/BoundingSphere.hpp"

namespace wsa_core
{

/**
 * @brief Approximates a wrench polytope by a sphere.
 *
 * Four modes:
 * - capacity: sphere centred on an operating wrench G, radius equal to the
 *   distance to the nearest facet plane (closed form)
 * - Chebyshev: largest inscribed sphere (linear program)
 * - max: largest inscribed sphere that still contains a reference wrench
 *   with a buffer (nonlinear program)
 * - Coriolis: provisional planar heuristic, see provisional::computeCoriolisMargin
 *
 * Every mode throws std::invalid_argument for an empty polytope or a
 * wrench of the wrong dimension. Solver failures in the optimization modes
 * are reported through SphereApproximationResult::converged.
 *
 * The approximator holds only configuration and shared const solvers, so
 * all methods are safe to call concurrently.
 */
class SphereApproximator
{
public:
  /// @brief Configuration parameters for sphere approximation
  struct Config
  {
    double coriolisZeroTolerance{1e-12};  ///< |A_i[0]| treated as zero
  };

  /// Default config, ECOS LP solver, NLopt SLSQP optimizer
  SphereApproximator();

  explicit SphereApproximator(const Config& config);

  /**
   * @throws std::invalid_argument if either solver is null
   */
  SphereApproximator(const Config& config,
                     std::shared_ptr<const LinearProgramSolver> lpSolver,
                     std::shared_ptr<const ConstrainedOptimizer> optimizer);

  ~SphereApproximator() = default;

  /**
   * @brief Capacity-margin sphere around an operating wrench.
   *
   * s_i = (b_i - A_i * G) / |A_i|, radius = min_i s_i, center = G. The
   * radius is negative when G lies outside the polytope.
   *
   * @throws std::invalid_argument if the polytope is empty or G has the
   *         wrong dimension
   */
  [[nodiscard]] BoundingSphere sphereApproximationCapacity(
    const WrenchPolytope& polytope,
    const Eigen::VectorXd& G) const;

  /**
   * @brief Chebyshev center: largest sphere inside the polytope.
   *
   * max r  s.t.  A_i o + |A_i| r <= b_i
   *
   * @throws std::invalid_argument if the polytope is empty
   */
  [[nodiscard]] SphereApproximationResult sphereApproximationChebyshev(
    const WrenchPolytope& polytope) const;

  /**
   * @brief Largest inscribed sphere containing a reference wrench.
   *
   * Maximizes the capacity radius r(c) over centers c inside the polytope,
   * subject to |c - xRef| + buffer <= r(c). Starts from the origin.
   *
   * @param polytope Non-empty wrench polytope
   * @param xRef Wrench that must lie inside the sphere
   * @param buffer Extra clearance around xRef
   * @throws std::invalid_argument if the polytope is empty or xRef has the
   *         wrong dimension
   */
  [[nodiscard]] SphereApproximationResult sphereApproximationMax(
    const WrenchPolytope& polytope,
    const Eigen::VectorXd& xRef,
    double buffer) const;

  /**
   * @brief Provisional Coriolis-adjusted capacity sphere around G.
   *
   * Radius may be +inf. Planar (first two coordinates) only.
   *
   * @throws std::invalid_argument if the polytope is empty, has dimension
   *         < 2, or G has the wrong dimension
   */
  [[nodiscard]] BoundingSphere sphereApproximationCoriolis(
    const WrenchPolytope& polytope,
    const Eigen::VectorXd& G,
    double q2) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  SphereApproximator(const SphereApproximator&) = default;
  SphereApproximator& operator=(const SphereApproximator&) = default;
  SphereApproximator(SphereApproximator&&) noexcept = default;
  SphereApproximator& operator=(SphereApproximator&&) noexcept = default;

private:
  static void requireNonEmpty(const WrenchPolytope& polytope, const char* caller);
  static void requireDimension(const WrenchPolytope& polytope,
                               const Eigen::VectorXd& w,
                               const char* caller);

  Config config_;
  std::shared_ptr<const LinearProgramSolver> lpSolver_;
  std::shared_ptr<const ConstrainedOptimizer> optimizer_;
};

}  // namespace wsa_core

#endif  // WSA_CORE_SPHERE_SPHERE_APPROXIMATOR_HPP
