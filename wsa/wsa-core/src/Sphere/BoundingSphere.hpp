#ifndef WSA_CORE_SPHERE_BOUNDING_SPHERE_HPP
#define WSA_CORE_SPHERE_BOUNDING_SPHERE_HPP

#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace wsa_core
{

/**
 * @brief Sphere approximating a wrench polytope.
 *
 * A radius <= 0 means no feasible enclosed sphere. A radius of +inf is kept
 * as-is (unbounded margin) and is never clamped.
 */
class BoundingSphere
{
public:
  BoundingSphere() = default;

  BoundingSphere(Eigen::VectorXd center, double radius)
    : center_{std::move(center)}, radius_{radius}
  {
  }

  [[nodiscard]] const Eigen::VectorXd& getCenter() const
  {
    return center_;
  }

  [[nodiscard]] double getRadius() const
  {
    return radius_;
  }

  /// True when the sphere encloses a set of positive size
  [[nodiscard]] bool isFeasible() const
  {
    return radius_ > 0.0;
  }

  [[nodiscard]] bool isUnbounded() const
  {
    return std::isinf(radius_) && radius_ > 0.0;
  }

  /**
   * @brief Test if a point lies inside the sphere.
   * @throws std::invalid_argument if the point dimension differs from the center
   */
  [[nodiscard]] bool contains(const Eigen::VectorXd& point,
                              double epsilon = 1e-9) const
  {
    if (point.size() != center_.size())
    {
      std::ostringstream oss;
      oss << "BoundingSphere::contains: point size " << point.size()
          << " does not match center size " << center_.size();
      throw std::invalid_argument{oss.str()};
    }
    return (point - center_).norm() <= radius_ + epsilon;
  }

private:
  Eigen::VectorXd center_;
  double radius_{0.0};
};

/**
 * @brief Outcome of an optimization-based sphere approximation.
 *
 * converged == false signals infeasibility or solver failure and is distinct
 * from a converged zero-radius sphere.
 */
struct SphereApproximationResult
{
  BoundingSphere sphere;
  bool converged{false};  ///< True if the solver reported an optimal point
  int exitFlag{0};        ///< Backend-specific exit code
  int iterations{0};      ///< Iterations / function evaluations performed
  double objectiveValue{std::numeric_limits<double>::quiet_NaN()};
  std::string message;    ///< Diagnostic text from the backend
};

}  // namespace wsa_core

#endif  // WSA_CORE_SPHERE_BOUNDING_SPHERE_HPP
