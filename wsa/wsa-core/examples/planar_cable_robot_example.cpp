// Achievable-wrench analysis of a planar point mass held by four cables
// anchored at the corners of a square frame.

#include <spdlog/spdlog.h>
#include <Eigen/Dense>
#include <cmath>
#include <exception>
#include <numbers>

#include "wsa-core/src/Polytope/PolytopeBuilder.hpp"
#include "wsa-core/src/Sphere/SphereApproximator.hpp"

using namespace wsa_core;

namespace
{

/// Columns are unit vectors from the mass at `position` toward each anchor
Eigen::MatrixXd cableStructureMatrix(const Eigen::Vector2d& position,
                                     const Eigen::MatrixXd& anchors)
{
  Eigen::MatrixXd As(2, anchors.cols());
  for (Eigen::Index j = 0; j < anchors.cols(); ++j)
  {
    const Eigen::Vector2d direction = anchors.col(j) - position;
    As.col(j) = direction.normalized();
  }
  return As;
}

}  // namespace

int main()
{
  spdlog::set_level(spdlog::level::info);

  Eigen::MatrixXd anchors(2, 4);
  anchors << -1.0, 1.0, 1.0, -1.0,
             -1.0, -1.0, 1.0, 1.0;

  const Eigen::Vector2d position{0.2, -0.1};
  const Eigen::MatrixXd As = cableStructureMatrix(position, anchors);

  // Cables only pull: tension between 1 N (slack limit) and 50 N
  const Eigen::VectorXd F_u = Eigen::VectorXd::Constant(4, 50.0);
  const Eigen::VectorXd F_l = Eigen::VectorXd::Constant(4, 1.0);

  // Gravity acting on a 2 kg mass
  const Eigen::Vector2d gravity{0.0, -2.0 * 9.81};

  try
  {
    const PolytopeBuilder builder;
    const BuildResult built = builder.build(As, F_u, F_l, gravity);
    if (!built.ok())
    {
      spdlog::error("Polytope build failed ({}): {}",
                    toString(built.status), built.reason);
      return 1;
    }

    const WrenchPolytope& polytope = built.polytope;
    spdlog::info("Wrench polytope: {} facets, {} half-spaces, area {:.2f}",
                 polytope.getFaceCount(),
                 polytope.getHalfSpaceCount(),
                 polytope.getVolume());

    const SphereApproximator approximator;

    const Eigen::Vector2d operatingWrench = Eigen::Vector2d::Zero();
    const BoundingSphere capacity =
      approximator.sphereApproximationCapacity(polytope, operatingWrench);
    spdlog::info("Capacity margin at static equilibrium: {:.3f} N",
                 capacity.getRadius());

    const SphereApproximationResult chebyshev =
      approximator.sphereApproximationChebyshev(polytope);
    if (chebyshev.converged)
    {
      spdlog::info("Chebyshev center ({:.3f}, {:.3f}), radius {:.3f} N",
                   chebyshev.sphere.getCenter()[0],
                   chebyshev.sphere.getCenter()[1],
                   chebyshev.sphere.getRadius());
    }

    const Eigen::Vector2d desiredWrench{5.0, 3.0};
    const SphereApproximationResult maxSphere =
      approximator.sphereApproximationMax(polytope, desiredWrench, 1.0);
    if (maxSphere.converged)
    {
      spdlog::info("Largest sphere around ({:.1f}, {:.1f}): center ({:.3f}, "
                   "{:.3f}), radius {:.3f} N",
                   desiredWrench[0], desiredWrench[1],
                   maxSphere.sphere.getCenter()[0],
                   maxSphere.sphere.getCenter()[1],
                   maxSphere.sphere.getRadius());
    }

    const double q2 = std::numbers::pi / 4.0;
    const BoundingSphere coriolis =
      approximator.sphereApproximationCoriolis(polytope, operatingWrench, q2);
    spdlog::info("Coriolis-adjusted margin (provisional) at q2 = {:.3f}: {}",
                 q2, coriolis.getRadius());
  }
  catch (const std::exception& e)
  {
    spdlog::error("Wrench analysis failed: {}", e.what());
    return 1;
  }

  return 0;
}
