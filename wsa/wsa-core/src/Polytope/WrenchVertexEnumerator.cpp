// Ticket: 0002_wrench_vertex_enumeration

#include "wsa-core/src/Polytope/WrenchVertexEnumerator.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace wsa_core
{

WrenchVertexEnumerator::WrenchVertexEnumerator(ActuationModel model,
                                               Eigen::Index maxActuators)
  : model_{std::move(model)}, combinationCount_{0}
{
  const Eigen::Index m = model_.getActuatorCount();
  const Eigen::Index limit = std::min(maxActuators, kMaxSupportedActuators);
  if (m > limit)
  {
    std::ostringstream oss;
    oss << "WrenchVertexEnumerator: " << m
        << " actuators exceed the enumeration limit of " << limit << " (2^"
        << m << " combinations)";
    throw std::invalid_argument{oss.str()};
  }
  combinationCount_ = std::uint64_t{1} << static_cast<unsigned>(m);
}

Eigen::VectorXd WrenchVertexEnumerator::force(std::uint64_t k) const
{
  if (k >= combinationCount_)
  {
    std::ostringstream oss;
    oss << "WrenchVertexEnumerator::force: combination " << k
        << " out of range [0, " << combinationCount_ << ")";
    throw std::out_of_range{oss.str()};
  }

  const Eigen::Index m = model_.getActuatorCount();
  const Eigen::VectorXd& upper = model_.getUpperBounds();
  const Eigen::VectorXd& lower = model_.getLowerBounds();

  Eigen::VectorXd f(m);
  for (Eigen::Index i = 0; i < m; ++i)
  {
    const auto bit = static_cast<unsigned>(m - 1 - i);
    const bool useUpper = ((k >> bit) & std::uint64_t{1}) != 0;
    f[i] = useUpper ? upper[i] : lower[i];
  }
  return f;
}

Eigen::VectorXd WrenchVertexEnumerator::wrench(std::uint64_t k) const
{
  return model_.toWrench(force(k));
}

Eigen::MatrixXd WrenchVertexEnumerator::enumerate() const
{
  const auto rows = static_cast<Eigen::Index>(combinationCount_);
  Eigen::MatrixXd W(rows, model_.getDofCount());
  for (std::uint64_t k = 0; k < combinationCount_; ++k)
  {
    W.row(static_cast<Eigen::Index>(k)) = wrench(k).transpose();
  }
  return W;
}

}  // namespace wsa_core
