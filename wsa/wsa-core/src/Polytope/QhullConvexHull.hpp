#ifndef WSA_CORE_POLYTOPE_QHULL_CONVEX_HULL_HPP
#define WSA_CORE_POLYTOPE_QHULL_CONVEX_HULL_HPP

#include <Eigen/Dense>

#include "wsa-core/src/Polytope/ConvexHullBackend.hpp"

// Forward declare Qhull C API types
extern "C"
{
  // NOLINTNEXTLINE(readability-identifier-naming)
  struct qhT;
}

namespace wsa_core
{

/**
 * @brief Convex hull of an n-dimensional point cloud computed with Qhull.
 *
 * Uses the reentrant Qhull API with a stack-local qhT, so concurrent calls on
 * the same instance are safe. Facets are triangulated ("Qt") so each facet is
 * a simplex of n points; "Qx" is added for n >= 5.
 *
 * One-dimensional clouds are handled without Qhull: the hull is the segment
 * between the smallest and largest point, with two single-point facets.
 */
class QhullConvexHull : public ConvexHullBackend
{
public:
  QhullConvexHull() = default;
  ~QhullConvexHull() override = default;

  /**
   * @brief Compute the hull of the rows of points.
   *
   * @param points Point cloud (numPoints x dimension)
   * @return Facet index table (numFacets x dimension) and volume
   * @throws std::runtime_error if the cloud is empty, has fewer than
   *         dimension + 1 points, is flat/degenerate, or Qhull fails
   */
  [[nodiscard]] HullResult compute(
    const Eigen::MatrixXd& points) const override;

  QhullConvexHull(const QhullConvexHull&) = default;
  QhullConvexHull& operator=(const QhullConvexHull&) = default;
  QhullConvexHull(QhullConvexHull&&) noexcept = default;
  QhullConvexHull& operator=(QhullConvexHull&&) noexcept = default;

private:
  static HullResult computeInterval(const Eigen::MatrixXd& points);

  /**
   * @brief Extract the simplicial facet table from a finished Qhull run.
   *
   * @param qh Qhull state structure
   * @param dimension Point dimension (vertices per facet)
   */
  static Eigen::MatrixXi extractFacetIndices(qhT* qh, int dimension);
};

}  // namespace wsa_core

#endif  // WSA_CORE_POLYTOPE_QHULL_CONVEX_HULL_HPP
