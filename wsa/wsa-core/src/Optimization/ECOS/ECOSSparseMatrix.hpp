// Ticket: 0004_chebyshev_center_ecos

#ifndef WSA_CORE_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP
#define WSA_CORE_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP

#include <ecos/ecos.h>
#include <Eigen/Dense>
#include <vector>

namespace wsa_core
{

/**
 * @brief Eigen dense matrix in the CSC (Compressed Sparse Column) layout
 * expected by ECOS.
 *
 * - col_ptrs[j] = index in data/row_indices where column j starts
 *   (size ncols + 1, col_ptrs[ncols] == nnz)
 * - row_indices[k] = row of data[k]
 *
 * Example for matrix:
 *   [1.0  0.0  2.0]
 *   [0.0  3.0  0.0]
 *
 * CSC representation:
 *   data = [1.0, 3.0, 2.0]
 *   row_indices = [0, 1, 0]
 *   col_ptrs = [0, 1, 2, 3]
 *
 * ECOS keeps raw pointers into these arrays, so an instance must outlive any
 * workspace set up from it (see ECOSData).
 */
struct ECOSSparseMatrix
{
  std::vector<pfloat> data;         // Non-zero values
  std::vector<idxint> row_indices;  // Row index for each non-zero
  std::vector<idxint> col_ptrs;     // Column pointers (size: ncols+1)
  idxint nrows{0};
  idxint ncols{0};
  idxint nnz{0};

  ECOSSparseMatrix() = default;

  /**
   * @brief Convert a dense matrix, dropping entries with
   * |value| <= sparsity_threshold.
   *
   * @throws std::invalid_argument if the matrix has a zero dimension
   */
  static ECOSSparseMatrix fromDense(const Eigen::MatrixXd& mat,
                                    double sparsity_threshold = 1e-12);

  /// Expand back to a dense matrix
  [[nodiscard]] Eigen::MatrixXd toDense() const;

  ECOSSparseMatrix(const ECOSSparseMatrix&) = default;
  ECOSSparseMatrix& operator=(const ECOSSparseMatrix&) = default;
  ECOSSparseMatrix(ECOSSparseMatrix&&) noexcept = default;
  ECOSSparseMatrix& operator=(ECOSSparseMatrix&&) noexcept = default;
  ~ECOSSparseMatrix() = default;
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_ECOS_ECOS_SPARSE_MATRIX_HPP
