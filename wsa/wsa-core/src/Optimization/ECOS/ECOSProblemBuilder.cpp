// Ticket: 0004_chebyshev_center_ecos

#include "wsa-core/src/Optimization/ECOS/ECOSProblemBuilder.hpp"

#include <sstream>
#include <stdexcept>

namespace wsa_core
{

ECOSData ECOSProblemBuilder::buildLinearProgram(const Eigen::VectorXd& c,
                                                const Eigen::MatrixXd& G,
                                                const Eigen::VectorXd& h)
{
  if (G.rows() == 0 || G.cols() == 0)
  {
    throw std::invalid_argument{
      "ECOSProblemBuilder::buildLinearProgram: G must be non-empty"};
  }

  if (c.size() != G.cols())
  {
    std::ostringstream oss;
    oss << "ECOSProblemBuilder::buildLinearProgram: c size " << c.size()
        << " does not match G columns " << G.cols();
    throw std::invalid_argument{oss.str()};
  }

  if (h.size() != G.rows())
  {
    std::ostringstream oss;
    oss << "ECOSProblemBuilder::buildLinearProgram: h size " << h.size()
        << " does not match G rows " << G.rows();
    throw std::invalid_argument{oss.str()};
  }

  if (!c.allFinite() || !G.allFinite() || !h.allFinite())
  {
    throw std::invalid_argument{
      "ECOSProblemBuilder::buildLinearProgram: non-finite problem data"};
  }

  const auto numVariables = static_cast<idxint>(G.cols());
  const auto numRows = static_cast<idxint>(G.rows());

  // Every row lives in the positive orthant, no second-order cones
  ECOSData data{numVariables, numRows};

  data.G_ = ECOSSparseMatrix::fromDense(G);
  data.h_.assign(h.data(), h.data() + h.size());
  data.c_.assign(c.data(), c.data() + c.size());

  return data;
}

}  // namespace wsa_core
