// Ticket: 0006_coriolis_margin

#include "wsa-core/src/Sphere/CoriolisMargin.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "wsa-core/src/Utils/utils.hpp"

namespace wsa_core::provisional
{

namespace
{

double signOf(double value)
{
  if (value > 0.0)
  {
    return 1.0;
  }
  if (value < 0.0)
  {
    return -1.0;
  }
  return 0.0;
}

}  // namespace

Eigen::VectorXd computeCoriolisFacetMargins(const WrenchPolytope& polytope,
                                            const Eigen::VectorXd& G,
                                            double q2,
                                            double zeroTolerance)
{
  if (polytope.isEmpty())
  {
    throw std::invalid_argument{
      "computeCoriolisMargin: polytope has no feasible half-spaces"};
  }

  const Eigen::Index dim = polytope.getDimension();
  if (dim < 2)
  {
    std::ostringstream oss;
    oss << "computeCoriolisMargin: requires dimension >= 2, got " << dim;
    throw std::invalid_argument{oss.str()};
  }

  if (G.size() != dim)
  {
    std::ostringstream oss;
    oss << "computeCoriolisMargin: G size " << G.size()
        << " does not match polytope dimension " << dim;
    throw std::invalid_argument{oss.str()};
  }

  const Eigen::MatrixXd& A = polytope.getA();
  const Eigen::VectorXd& b = polytope.getB();
  const double t = signOf(std::sin(q2));

  Eigen::VectorXd margins(A.rows());
  for (Eigen::Index i = 0; i < A.rows(); ++i)
  {
    const Eigen::VectorXd Ai = A.row(i).transpose();
    const double norm = Ai.norm();
    double s = (b[i] - Ai.dot(G)) / norm;

    const Eigen::VectorXd p = G + s * Ai / norm;
    if (t * (p[1] - G[1]) < 0.0)
    {
      if (isNearZero(Ai[0], zeroTolerance))
      {
        s = std::numeric_limits<double>::infinity();
      }
      else
      {
        const double pd = (b[i] - Ai[1] * G[1]) / Ai[0];
        s = std::isinf(pd) ? std::numeric_limits<double>::infinity()
                           : std::abs(pd - G[0]);
      }
    }

    margins[i] = s;
  }

  return margins;
}

double computeCoriolisMargin(const WrenchPolytope& polytope,
                             const Eigen::VectorXd& G,
                             double q2,
                             double zeroTolerance)
{
  return computeCoriolisFacetMargins(polytope, G, q2, zeroTolerance).minCoeff();
}

}  // namespace wsa_core::provisional
