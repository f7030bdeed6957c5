// Ticket: 0003_polytope_builder

#ifndef WSA_CORE_POLYTOPE_POLYTOPE_BUILDER_HPP
#define WSA_CORE_POLYTOPE_POLYTOPE_BUILDER_HPP

#include <Eigen/Dense>
#include <chrono>
#include <memory>
#include <string>

#include "wsa-core/src/Actuation/ActuationModel.hpp"
#include "wsa-core/src/Polytope/ConvexHullBackend.hpp"
#include "wsa-core/src/Polytope/WrenchPolytope.hpp"

namespace wsa_core
{

/// Outcome tag of a polytope build
enum class BuildStatus
{
  Success,            ///< Polytope built (possibly with every facet degenerate)
  DegenerateInput,    ///< Vertex cloud collapsed onto a single point
  HullFailure,        ///< Convex-hull backend threw
  NoOrientingVertex,  ///< A facet had no off-plane vertex to orient against
  TimedOut            ///< Config::timeout elapsed before completion
};

[[nodiscard]] const char* toString(BuildStatus status);

/**
 * @brief Result of PolytopeBuilder::build.
 *
 * On any status other than Success the polytope is in its zero state
 * (getFaceCount() == 0), so callers that only inspect the polytope still see
 * "no feasible set".
 */
struct BuildResult
{
  BuildStatus status{BuildStatus::Success};
  std::string reason;  ///< Diagnostic message, empty on success
  WrenchPolytope polytope;

  [[nodiscard]] bool ok() const
  {
    return status == BuildStatus::Success;
  }
};

/**
 * @brief Builds the achievable-wrench polytope of an actuation model.
 *
 * Algorithm:
 * 1. Enumerate all 2^m bound-extreme force combinations F_k
 * 2. Map each through W_k = As * F_k + offset
 * 3. Compute the convex hull of the W_k (facet table + volume)
 * 4. For each facet, take the null space of its edge vectors as the normal
 *    Ti. Facets whose null space has dimension > 1 do not define a unique
 *    hyperplane and are skipped. The inequality Ti * w <= Ti * W_first is
 *    flipped if the first vertex lying strictly off the plane violates it.
 * 5. Retained rows form A, b in facet order
 *
 * Dimension and bound errors are thrown eagerly as std::invalid_argument.
 * Numerical failures (degenerate cloud, hull failure) are reported through
 * BuildResult and never thrown.
 *
 * The builder is stateless between builds: build() is const and safe to call
 * concurrently.
 *
 * @ticket 0003_polytope_builder
 */
class PolytopeBuilder
{
public:
  /// @brief Configuration parameters for polytope construction
  struct Config
  {
    Eigen::Index maxActuators{20};       ///< Tractability bound on m (2^m vertices)
    double orientationTolerance{1e-6};   ///< Off-plane distance for orientation
    double degeneracyTolerance{1e-12};   ///< Spread below which the cloud is a point
    std::chrono::milliseconds timeout{0};  ///< Build deadline, 0 disables
  };

  /// Default config, Qhull backend
  PolytopeBuilder();

  /// Given config, Qhull backend
  explicit PolytopeBuilder(const Config& config);

  /**
   * @param config Construction parameters
   * @param hullBackend Convex-hull implementation
   * @throws std::invalid_argument if hullBackend is null
   */
  PolytopeBuilder(const Config& config,
                  std::shared_ptr<const ConvexHullBackend> hullBackend);

  ~PolytopeBuilder() = default;

  /**
   * @brief Build the wrench polytope of a validated actuation model.
   *
   * @param model Actuation model
   * @return Tagged result carrying the polytope
   * @throws std::invalid_argument if the actuator count exceeds
   *         Config::maxActuators
   */
  [[nodiscard]] BuildResult build(const ActuationModel& model) const;

  /**
   * @brief Validate raw inputs and build the wrench polytope.
   *
   * @param As Structure matrix (n x m)
   * @param F_u Upper force bounds (m)
   * @param F_l Lower force bounds (m)
   * @param offset Wrench offset (n), empty for zero
   * @throws std::invalid_argument on inconsistent dimensions or bounds
   */
  [[nodiscard]] BuildResult build(
    const Eigen::MatrixXd& As,
    const Eigen::VectorXd& F_u,
    const Eigen::VectorXd& F_l,
    const Eigen::VectorXd& offset = Eigen::VectorXd{}) const;

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  /**
   * @brief Orthonormal basis of the null space of M (one vector per column).
   *
   * Rank is decided with the tolerance max(rows, cols) * eps * sigma_max. A
   * matrix with zero rows has the full identity as its null-space basis.
   */
  [[nodiscard]] static Eigen::MatrixXd nullSpace(const Eigen::MatrixXd& M);

  PolytopeBuilder(const PolytopeBuilder&) = default;
  PolytopeBuilder& operator=(const PolytopeBuilder&) = default;
  PolytopeBuilder(PolytopeBuilder&&) noexcept = default;
  PolytopeBuilder& operator=(PolytopeBuilder&&) noexcept = default;

private:
  static BuildResult failure(BuildStatus status, std::string reason);

  Config config_;
  std::shared_ptr<const ConvexHullBackend> hullBackend_;
};

}  // namespace wsa_core

#endif  // WSA_CORE_POLYTOPE_POLYTOPE_BUILDER_HPP
