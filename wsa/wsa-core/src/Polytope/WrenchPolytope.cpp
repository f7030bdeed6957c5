#include "wsa-core/src/Polytope/WrenchPolytope.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "wsa-core/src/Utils/utils.hpp"

namespace wsa_core
{

WrenchPolytope::WrenchPolytope(Eigen::Index numFaces,
                               Eigen::MatrixXd A,
                               Eigen::VectorXd b,
                               double volume,
                               Eigen::MatrixXd wrenchCombinations,
                               Eigen::MatrixXi convexHullIndices)
  : numFaces_{numFaces},
    A_{std::move(A)},
    b_{std::move(b)},
    volume_{volume},
    wrenchCombinations_{std::move(wrenchCombinations)},
    convexHullIndices_{std::move(convexHullIndices)}
{
  if (A_.rows() != b_.size())
  {
    std::ostringstream oss;
    oss << "WrenchPolytope: A has " << A_.rows() << " rows but b has "
        << b_.size() << " entries";
    throw std::invalid_argument{oss.str()};
  }

  for (Eigen::Index i = 0; i < A_.rows(); ++i)
  {
    if (isNearZero(A_.row(i).norm()))
    {
      std::ostringstream oss;
      oss << "WrenchPolytope: half-space " << i << " has a zero normal";
      throw std::invalid_argument{oss.str()};
    }
  }

  if (A_.rows() > 0 && wrenchCombinations_.size() > 0 &&
      wrenchCombinations_.cols() != A_.cols())
  {
    std::ostringstream oss;
    oss << "WrenchPolytope: A has " << A_.cols()
        << " columns but the vertex cloud has " << wrenchCombinations_.cols();
    throw std::invalid_argument{oss.str()};
  }
}

Eigen::Index WrenchPolytope::getDimension() const
{
  if (A_.rows() > 0)
  {
    return A_.cols();
  }
  return wrenchCombinations_.cols();
}

bool WrenchPolytope::contains(const Eigen::VectorXd& w, double epsilon) const
{
  if (isEmpty())
  {
    return false;
  }
  checkDimension(w, "contains");

  // Inside if on the non-positive side (within epsilon) of every half-space
  const Eigen::VectorXd slack = A_ * w - b_;
  return (slack.array() <= epsilon).all();
}

double WrenchPolytope::signedDistance(const Eigen::VectorXd& w) const
{
  if (isEmpty())
  {
    return std::numeric_limits<double>::infinity();
  }
  checkDimension(w, "signedDistance");

  double maxDistance = -std::numeric_limits<double>::infinity();
  for (Eigen::Index i = 0; i < A_.rows(); ++i)
  {
    const double distance = (A_.row(i).dot(w) - b_[i]) / A_.row(i).norm();
    maxDistance = std::max(maxDistance, distance);
  }
  return maxDistance;
}

void WrenchPolytope::checkDimension(const Eigen::VectorXd& w,
                                    const char* caller) const
{
  if (w.size() != A_.cols())
  {
    std::ostringstream oss;
    oss << "WrenchPolytope::" << caller << ": wrench size " << w.size()
        << " does not match polytope dimension " << A_.cols();
    throw std::invalid_argument{oss.str()};
  }
}

}  // namespace wsa_core
