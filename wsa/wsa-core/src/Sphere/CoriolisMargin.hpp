// Ticket: 0006_coriolis_margin

#ifndef WSA_CORE_SPHERE_CORIOLIS_MARGIN_HPP
#define WSA_CORE_SPHERE_CORIOLIS_MARGIN_HPP

#include <Eigen/Dense>

#include "wsa-core/src/Polytope/WrenchPolytope.hpp"

/**
 * @brief Coriolis-adjusted capacity margin for planar two-link arms.
 *
 * PROVISIONAL. The redirection rule below reproduces an experimental
 * heuristic and has no established physical derivation. It lives in its own
 * namespace so callers opt in explicitly and it can be replaced without
 * touching the other sphere modes.
 *
 * Only the first two wrench coordinates are used. With t = sign(sin(q2)):
 * - s_i = (b_i - A_i * G) / |A_i| (as for the capacity margin)
 * - p = G + s_i * A_i / |A_i| is the foot point on facet i
 * - if t * (p[1] - G[1]) < 0 the margin is redirected along coordinate 0:
 *   pd = (b_i - A_i[1] * G[1]) / A_i[0] and s_i = |pd - G[0]|,
 *   or +inf when A_i[0] is (near) zero
 */
namespace wsa_core::provisional
{

/**
 * @brief Per-facet Coriolis-adjusted margins.
 *
 * @param polytope Non-empty wrench polytope of dimension >= 2
 * @param G Operating wrench (polytope dimension)
 * @param q2 Second joint angle [rad]
 * @param zeroTolerance |A_i[0]| at or below which the redirected margin is +inf
 * @return One margin per half-space, entries may be +inf
 * @throws std::invalid_argument if the polytope is empty, has dimension < 2,
 *         or G has the wrong size
 */
[[nodiscard]] Eigen::VectorXd computeCoriolisFacetMargins(
  const WrenchPolytope& polytope,
  const Eigen::VectorXd& G,
  double q2,
  double zeroTolerance = 1e-12);

/// Minimum of computeCoriolisFacetMargins, may be +inf
[[nodiscard]] double computeCoriolisMargin(const WrenchPolytope& polytope,
                                           const Eigen::VectorXd& G,
                                           double q2,
                                           double zeroTolerance = 1e-12);

}  // namespace wsa_core::provisional

#endif  // WSA_CORE_SPHERE_CORIOLIS_MARGIN_HPP
