#include "wsa-core/src/Actuation/ActuationModel.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace wsa_core
{

ActuationModel::ActuationModel(Eigen::MatrixXd As,
                               Eigen::VectorXd F_u,
                               Eigen::VectorXd F_l,
                               Eigen::VectorXd offset)
  : structureMatrix_{std::move(As)},
    upperBounds_{std::move(F_u)},
    lowerBounds_{std::move(F_l)},
    offset_{std::move(offset)}
{
  if (offset_.size() == 0)
  {
    offset_ = Eigen::VectorXd::Zero(structureMatrix_.rows());
  }
  validate();
}

Eigen::VectorXd ActuationModel::toWrench(const Eigen::VectorXd& forces) const
{
  if (forces.size() != getActuatorCount())
  {
    std::ostringstream oss;
    oss << "ActuationModel::toWrench: force vector size " << forces.size()
        << " does not match actuator count " << getActuatorCount();
    throw std::invalid_argument{oss.str()};
  }
  return structureMatrix_ * forces + offset_;
}

void ActuationModel::validate() const
{
  const Eigen::Index n = structureMatrix_.rows();
  const Eigen::Index m = structureMatrix_.cols();

  if (n == 0 || m == 0)
  {
    std::ostringstream oss;
    oss << "ActuationModel: structure matrix must be non-empty, got " << n
        << " x " << m;
    throw std::invalid_argument{oss.str()};
  }

  if (upperBounds_.size() != m)
  {
    std::ostringstream oss;
    oss << "ActuationModel: F_u size " << upperBounds_.size()
        << " does not match actuator count " << m;
    throw std::invalid_argument{oss.str()};
  }

  if (lowerBounds_.size() != m)
  {
    std::ostringstream oss;
    oss << "ActuationModel: F_l size " << lowerBounds_.size()
        << " does not match actuator count " << m;
    throw std::invalid_argument{oss.str()};
  }

  if (offset_.size() != n)
  {
    std::ostringstream oss;
    oss << "ActuationModel: offset size " << offset_.size()
        << " does not match wrench dimension " << n;
    throw std::invalid_argument{oss.str()};
  }

  if (!structureMatrix_.allFinite() || !upperBounds_.allFinite() ||
      !lowerBounds_.allFinite() || !offset_.allFinite())
  {
    throw std::invalid_argument{
      "ActuationModel: inputs must contain only finite values"};
  }

  for (Eigen::Index i = 0; i < m; ++i)
  {
    if (lowerBounds_[i] > upperBounds_[i])
    {
      std::ostringstream oss;
      oss << "ActuationModel: actuator " << i << " has F_l = "
          << lowerBounds_[i] << " greater than F_u = " << upperBounds_[i];
      throw std::invalid_argument{oss.str()};
    }
  }
}

}  // namespace wsa_core
