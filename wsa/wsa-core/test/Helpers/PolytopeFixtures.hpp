#ifndef WSA_CORE_TEST_HELPERS_POLYTOPE_FIXTURES_HPP
#define WSA_CORE_TEST_HELPERS_POLYTOPE_FIXTURES_HPP

#include <Eigen/Dense>

#include "wsa-core/src/Polytope/WrenchPolytope.hpp"

namespace wsa_core::test
{

/**
 * @brief Axis-aligned box |w_0| <= halfWidth, |w_1| <= halfHeight in
 * half-space form, built directly without a hull backend.
 */
inline WrenchPolytope makeBoxPolytope(double halfWidth, double halfHeight)
{
  Eigen::MatrixXd A(4, 2);
  A << 1.0, 0.0,
       -1.0, 0.0,
       0.0, 1.0,
       0.0, -1.0;

  Eigen::VectorXd b(4);
  b << halfWidth, halfWidth, halfHeight, halfHeight;

  Eigen::MatrixXd corners(4, 2);
  corners << -halfWidth, -halfHeight,
             -halfWidth, halfHeight,
             halfWidth, -halfHeight,
             halfWidth, halfHeight;

  Eigen::MatrixXi facets(4, 2);
  facets << 2, 3,
            0, 1,
            1, 3,
            0, 2;

  return WrenchPolytope{4, A, b, 4.0 * halfWidth * halfHeight, corners, facets};
}

/// Unit square |w_0| <= 1, |w_1| <= 1
inline WrenchPolytope makeUnitSquarePolytope()
{
  return makeBoxPolytope(1.0, 1.0);
}

/// n x n identity structure matrix
inline Eigen::MatrixXd identityStructure(Eigen::Index n)
{
  return Eigen::MatrixXd::Identity(n, n);
}

}  // namespace wsa_core::test

#endif  // WSA_CORE_TEST_HELPERS_POLYTOPE_FIXTURES_HPP
