#ifndef WSA_CORE_POLYTOPE_CONVEX_HULL_BACKEND_HPP
#define WSA_CORE_POLYTOPE_CONVEX_HULL_BACKEND_HPP

#include <Eigen/Dense>

namespace wsa_core
{

/**
 * @brief Facet enumeration of a convex hull.
 *
 * Each row of facetIndices lists the point indices (rows of the input cloud)
 * of one simplicial facet, so the table is numFacets x dimension.
 */
struct HullResult
{
  Eigen::MatrixXi facetIndices;
  double volume{0.0};
};

/**
 * @brief Convex-hull capability used by PolytopeBuilder.
 *
 * Implementations signal failure (degenerate or coincident input, numerical
 * breakdown) by throwing std::runtime_error. Implementations must be safe to
 * call concurrently from several threads.
 */
class ConvexHullBackend
{
public:
  virtual ~ConvexHullBackend() = default;

  /**
   * @brief Compute the convex hull of a point cloud.
   * @param points One point per row (numPoints x dimension)
   * @return Simplicial facet table and hull volume
   * @throws std::runtime_error on failure
   */
  [[nodiscard]] virtual HullResult compute(
    const Eigen::MatrixXd& points) const = 0;

protected:
  ConvexHullBackend() = default;
  ConvexHullBackend(const ConvexHullBackend&) = default;
  ConvexHullBackend& operator=(const ConvexHullBackend&) = default;
  ConvexHullBackend(ConvexHullBackend&&) noexcept = default;
  ConvexHullBackend& operator=(ConvexHullBackend&&) noexcept = default;
};

}  // namespace wsa_core

#endif  // WSA_CORE_POLYTOPE_CONVEX_HULL_BACKEND_HPP
