// Ticket: 0004_chebyshev_center_ecos

#ifndef WSA_CORE_OPTIMIZATION_ECOS_ECOS_DATA_HPP
#define WSA_CORE_OPTIMIZATION_ECOS_ECOS_DATA_HPP

#include <ecos/ecos.h>
#include <memory>
#include <vector>

#include "wsa-core/src/Optimization/ECOS/ECOSSparseMatrix.hpp"

namespace wsa_core
{

/**
 * @brief Custom deleter for ECOS workspace pointer
 *
 * Calls ECOS_cleanup() when std::unique_ptr destroys the workspace.
 */
struct ECOSWorkspaceDeleter
{
  void operator()(pwork* w) const noexcept;
};

/// Type alias for managed ECOS workspace pointer with automatic cleanup
using ECOSWorkspacePtr = std::unique_ptr<pwork, ECOSWorkspaceDeleter>;

/**
 * @brief RAII owner of an ECOS linear program and its solver workspace
 *
 * Encodes the ECOS standard form restricted to a linear program
 *
 *   min c^T x  s.t.  G x + s = h,  s >= 0
 *
 * Every row of G belongs to the positive orthant (l = m): no second-order
 * cones and no equality block are passed to ECOS_setup().
 *
 * Usage pattern:
 * 1. Construct with problem dimensions
 * 2. Populate G_, h_, c_
 * 3. Call setup() to create the ECOS workspace
 * 4. Solve through workspace_.get()
 *
 * Not thread-safe; each solve owns its own ECOSData. Move-only.
 */
struct ECOSData
{
  // Problem dimensions
  idxint num_variables_{0};   // n: decision variables
  idxint num_inequality_{0};  // m: rows of G

  ECOSSparseMatrix G_;

  std::vector<pfloat> h_;  // Inequality RHS (m)
  std::vector<pfloat> c_;  // Linear objective (n)

  // IMPORTANT: Declared last so it is destroyed first. ECOS_cleanup() touches
  // the G_, h_ and c_ arrays while undoing its equilibration.
  ECOSWorkspacePtr workspace_{nullptr};

  /**
   * @param numVariables Number of decision variables n
   * @param numInequality Number of rows of G (m)
   */
  ECOSData(idxint numVariables, idxint numInequality);

  ~ECOSData() = default;

  ECOSData(ECOSData&& other) noexcept;

  /**
   * @brief Move assignment
   *
   * Cleans up the current workspace first, while this object's data arrays
   * are still valid.
   */
  ECOSData& operator=(ECOSData&& other) noexcept;

  ECOSData(const ECOSData&) = delete;
  ECOSData& operator=(const ECOSData&) = delete;

  /**
   * @brief Create the ECOS workspace by calling ECOS_setup()
   *
   * Preconditions:
   * - workspace_ is null
   * - G_ is num_inequality_ x num_variables_ and non-empty
   * - h_.size() == num_inequality_, c_.size() == num_variables_
   *
   * @throws std::runtime_error if a precondition is violated or ECOS_setup()
   *         fails. workspace_ stays null in that case.
   */
  void setup();

  [[nodiscard]] bool isSetup() const
  {
    return workspace_ != nullptr;
  }

  /// Release the workspace (idempotent)
  void cleanup();
};

}  // namespace wsa_core

#endif  // WSA_CORE_OPTIMIZATION_ECOS_ECOS_DATA_HPP
