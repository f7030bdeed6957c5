#ifndef WSA_CORE_POLYTOPE_WRENCH_POLYTOPE_HPP
#define WSA_CORE_POLYTOPE_WRENCH_POLYTOPE_HPP

#include <Eigen/Dense>

namespace wsa_core
{

/**
 * @brief Achievable-wrench polytope in half-space form A * w <= b.
 *
 * Produced by PolytopeBuilder and immutable afterwards. Besides the retained
 * half-spaces it keeps the enumerated vertex cloud and the raw hull facet
 * table for diagnostics.
 *
 * A default-constructed polytope is the empty (zero) state returned by a
 * failed build: no faces, no half-spaces, zero volume.
 *
 * Invariants:
 * - A.rows() == b.size()
 * - every row of A is non-zero
 * - every generating vertex satisfies A * w <= b (outward normals)
 */
class WrenchPolytope
{
public:
  WrenchPolytope() = default;

  /**
   * @param numFaces Hull facet count before degeneracy filtering
   * @param A Half-space normals, one per row (k x n)
   * @param b Half-space offsets (k)
   * @param volume Hull volume
   * @param wrenchCombinations Enumerated vertex cloud (2^m x n)
   * @param convexHullIndices Hull facet-to-vertex table (numFaces x n)
   * @throws std::invalid_argument if A.rows() != b.size(), a row of A has
   *         (near-)zero norm, or a non-empty vertex cloud disagrees with A
   *         on the dimension
   */
  WrenchPolytope(Eigen::Index numFaces,
                 Eigen::MatrixXd A,
                 Eigen::VectorXd b,
                 double volume,
                 Eigen::MatrixXd wrenchCombinations,
                 Eigen::MatrixXi convexHullIndices);

  /// Hull facet count before degeneracy filtering (n_faces)
  [[nodiscard]] Eigen::Index getFaceCount() const
  {
    return numFaces_;
  }

  /// Number of retained half-spaces (rows of A)
  [[nodiscard]] Eigen::Index getHalfSpaceCount() const
  {
    return A_.rows();
  }

  /// Wrench dimension n, 0 for an empty polytope
  [[nodiscard]] Eigen::Index getDimension() const;

  [[nodiscard]] const Eigen::MatrixXd& getA() const
  {
    return A_;
  }

  [[nodiscard]] const Eigen::VectorXd& getB() const
  {
    return b_;
  }

  [[nodiscard]] double getVolume() const
  {
    return volume_;
  }

  [[nodiscard]] const Eigen::MatrixXd& getWrenchCombinations() const
  {
    return wrenchCombinations_;
  }

  [[nodiscard]] const Eigen::MatrixXi& getConvexHullIndices() const
  {
    return convexHullIndices_;
  }

  /**
   * @brief True when the polytope carries no usable half-spaces.
   *
   * This is the case for a failed build (n_faces == 0) and for a hull whose
   * facets were all degenerate.
   */
  [[nodiscard]] bool isEmpty() const
  {
    return numFaces_ == 0 || A_.rows() == 0;
  }

  /**
   * @brief Test whether a wrench satisfies every half-space.
   *
   * @param w Wrench (n)
   * @param epsilon Tolerance on each inequality
   * @return false for an empty polytope
   * @throws std::invalid_argument if w has the wrong dimension
   */
  [[nodiscard]] bool contains(const Eigen::VectorXd& w,
                              double epsilon = 1e-6) const;

  /**
   * @brief Largest normalized constraint value max_i (A_i w - b_i) / |A_i|.
   *
   * Negative inside, positive outside. For a non-negative result this is the
   * distance to the nearest violated facet plane; for a negative result its
   * magnitude is the capacity margin at w.
   *
   * @param w Wrench (n)
   * @return +inf for an empty polytope
   * @throws std::invalid_argument if w has the wrong dimension
   */
  [[nodiscard]] double signedDistance(const Eigen::VectorXd& w) const;

private:
  void checkDimension(const Eigen::VectorXd& w, const char* caller) const;

  Eigen::Index numFaces_{0};
  Eigen::MatrixXd A_;
  Eigen::VectorXd b_;
  double volume_{0.0};
  Eigen::MatrixXd wrenchCombinations_;
  Eigen::MatrixXi convexHullIndices_;
};

}  // namespace wsa_core

#endif  // WSA_CORE_POLYTOPE_WRENCH_POLYTOPE_HPP
