#ifndef WSA_CORE_ACTUATION_ACTUATION_MODEL_HPP
#define WSA_CORE_ACTUATION_ACTUATION_MODEL_HPP

#include <Eigen/Dense>

namespace wsa_core
{

/**
 * @brief Linear actuation model mapping actuator forces to wrenches.
 *
 * The system model is
 *
 *   w = As * f + offset,   F_l <= f <= F_u
 *
 * where As is the n x m structure matrix (n = wrench dimension, m = number of
 * actuators). The model is validated on construction; an instance always
 * satisfies the dimensional and bound invariants.
 */
class ActuationModel
{
public:
  /**
   * @brief Construct and validate an actuation model.
   *
   * @param As Structure matrix (n x m)
   * @param F_u Per-actuator upper force bounds (m)
   * @param F_l Per-actuator lower force bounds (m)
   * @param offset Additive wrench offset (n). An empty vector means zero.
   * @throws std::invalid_argument if dimensions are inconsistent, any entry
   *         is non-finite, or F_l[i] > F_u[i] for some actuator i
   */
  ActuationModel(Eigen::MatrixXd As,
                 Eigen::VectorXd F_u,
                 Eigen::VectorXd F_l,
                 Eigen::VectorXd offset = Eigen::VectorXd{});

  /// Wrench dimension n (rows of As)
  [[nodiscard]] Eigen::Index getDofCount() const
  {
    return structureMatrix_.rows();
  }

  /// Number of actuators m (columns of As)
  [[nodiscard]] Eigen::Index getActuatorCount() const
  {
    return structureMatrix_.cols();
  }

  [[nodiscard]] const Eigen::MatrixXd& getStructureMatrix() const
  {
    return structureMatrix_;
  }

  [[nodiscard]] const Eigen::VectorXd& getUpperBounds() const
  {
    return upperBounds_;
  }

  [[nodiscard]] const Eigen::VectorXd& getLowerBounds() const
  {
    return lowerBounds_;
  }

  [[nodiscard]] const Eigen::VectorXd& getOffset() const
  {
    return offset_;
  }

  /**
   * @brief Map an actuator force vector to wrench space.
   * @param forces Actuator forces (m)
   * @return As * forces + offset
   * @throws std::invalid_argument if forces has the wrong size
   */
  [[nodiscard]] Eigen::VectorXd toWrench(const Eigen::VectorXd& forces) const;

  ActuationModel(const ActuationModel&) = default;
  ActuationModel& operator=(const ActuationModel&) = default;
  ActuationModel(ActuationModel&&) noexcept = default;
  ActuationModel& operator=(ActuationModel&&) noexcept = default;
  ~ActuationModel() = default;

private:
  void validate() const;

  Eigen::MatrixXd structureMatrix_;  // As (n x m)
  Eigen::VectorXd upperBounds_;      // F_u (m)
  Eigen::VectorXd lowerBounds_;      // F_l (m)
  Eigen::VectorXd offset_;           // Wrench offset (n)
};

}  // namespace wsa_core

#endif  // WSA_CORE_ACTUATION_ACTUATION_MODEL_HPP
