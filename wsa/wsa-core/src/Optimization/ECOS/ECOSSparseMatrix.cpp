// Ticket: 0004_chebyshev_center_ecos

#include "wsa-core/src/Optimization/ECOS/ECOSSparseMatrix.hpp"

#include <cmath>
#include <stdexcept>

namespace wsa_core
{

ECOSSparseMatrix ECOSSparseMatrix::fromDense(const Eigen::MatrixXd& mat,
                                             double sparsity_threshold)
{
  if (mat.rows() == 0 || mat.cols() == 0)
  {
    throw std::invalid_argument(
      "ECOSSparseMatrix::fromDense: matrix must have non-zero dimensions");
  }

  ECOSSparseMatrix result{};
  result.nrows = static_cast<idxint>(mat.rows());
  result.ncols = static_cast<idxint>(mat.cols());
  result.col_ptrs.reserve(static_cast<size_t>(result.ncols) + 1);

  // Eigen's default storage is column-major, which is the CSC traversal order
  for (Eigen::Index col = 0; col < mat.cols(); ++col)
  {
    result.col_ptrs.push_back(static_cast<idxint>(result.data.size()));
    for (Eigen::Index row = 0; row < mat.rows(); ++row)
    {
      const double value = mat(row, col);
      if (std::abs(value) > sparsity_threshold)
      {
        result.data.push_back(static_cast<pfloat>(value));
        result.row_indices.push_back(static_cast<idxint>(row));
      }
    }
  }
  result.col_ptrs.push_back(static_cast<idxint>(result.data.size()));
  result.nnz = static_cast<idxint>(result.data.size());

  return result;
}

Eigen::MatrixXd ECOSSparseMatrix::toDense() const
{
  Eigen::MatrixXd dense =
    Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(nrows),
                          static_cast<Eigen::Index>(ncols));
  for (idxint col = 0; col < ncols; ++col)
  {
    const auto begin = static_cast<size_t>(col_ptrs[static_cast<size_t>(col)]);
    const auto end =
      static_cast<size_t>(col_ptrs[static_cast<size_t>(col) + 1]);
    for (size_t k = begin; k < end; ++k)
    {
      dense(static_cast<Eigen::Index>(row_indices[k]),
            static_cast<Eigen::Index>(col)) = data[k];
    }
  }
  return dense;
}

}  // namespace wsa_core
