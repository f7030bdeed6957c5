// Ticket: 0002_wrench_vertex_enumeration

#ifndef WSA_CORE_POLYTOPE_WRENCH_VERTEX_ENUMERATOR_HPP
#define WSA_CORE_POLYTOPE_WRENCH_VERTEX_ENUMERATOR_HPP

#include <Eigen/Dense>
#include <cstdint>

#include "wsa-core/src/Actuation/ActuationModel.hpp"

namespace wsa_core
{

/**
 * @brief Enumerates the bound-extreme actuator force combinations of an
 * ActuationModel and their images in wrench space.
 *
 * Combination k selects, for actuator i, the upper bound F_u[i] when bit
 * (m - 1 - i) of k is set and the lower bound F_l[i] otherwise, i.e. k is read
 * most-significant-bit first as actuator 0. Combination 0 is all lower bounds
 * and combination 2^m - 1 is all upper bounds.
 *
 * Single combinations can be generated lazily with force()/wrench();
 * enumerate() materializes the full 2^m x n vertex cloud.
 *
 * The enumerator holds its own copy of the model.
 *
 * @ticket 0002_wrench_vertex_enumeration
 */
class WrenchVertexEnumerator
{
public:
  /// Largest actuator count whose combination count fits the index type
  static constexpr Eigen::Index kMaxSupportedActuators = 62;

  /**
   * @param model Validated actuation model, copied or moved in
   * @param maxActuators Tractability bound on m
   * @throws std::invalid_argument if the model has more than
   *         min(maxActuators, kMaxSupportedActuators) actuators
   */
  WrenchVertexEnumerator(ActuationModel model, Eigen::Index maxActuators);

  /// Number of combinations, 2^m
  [[nodiscard]] std::uint64_t getCombinationCount() const
  {
    return combinationCount_;
  }

  /// Actuator force vector of combination k
  [[nodiscard]] Eigen::VectorXd force(std::uint64_t k) const;

  /// Wrench As * force(k) + offset of combination k
  [[nodiscard]] Eigen::VectorXd wrench(std::uint64_t k) const;

  /**
   * @brief Materialize every combination's wrench.
   * @return 2^m x n matrix, row k is wrench(k)
   */
  [[nodiscard]] Eigen::MatrixXd enumerate() const;

private:
  ActuationModel model_;
  std::uint64_t combinationCount_;
};

}  // namespace wsa_core

#endif  // WSA_CORE_POLYTOPE_WRENCH_VERTEX_ENUMERATOR_HPP
