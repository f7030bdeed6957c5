// Ticket: 0004_chebyshev_center_ecos

#ifndef WSA_CORE_OPTIMIZATION_ECOS_ECOS_PROBLEM_BUILDER_HPP
#define WSA_CORE_OPTIMIZATION_ECOS_ECOS_PROBLEM_BUILDER_HPP

#include <Eigen/Dense>

#include "wsa-core/src/Optimization/ECOS/ECOSData.hpp"

namespace wsa_core
{

/**
 * @brief Builds ECOS problem data for linear programs.
 *
 * The program
 *
 *   min c^T x  s.t.  G x <= h
 *
 * maps onto ECOS standard form with every row of G in the positive orthant
 * (l = m) and no second-order cones: s = h - G x >= 0.
 *
 * The returned ECOSData is populated and ready for ECOSData::setup().
 */
class ECOSProblemBuilder
{
public:
  /**
   * @param c Objective coefficients (n)
   * @param G Inequality matrix (m x n)
   * @param h Inequality right-hand side (m)
   * @throws std::invalid_argument if G is empty, c.size() != G.cols(),
   *         h.size() != G.rows(), or any entry is non-finite
   */
  static ECOSData buildLinearProgram(const Eigen::VectorXd& c,
                                     const Eigen::MatrixXd& G,
                                     const Eigen::VectorXd& h);
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_ECOS_ECOS_PROBLEM_BUILDER_HPP
