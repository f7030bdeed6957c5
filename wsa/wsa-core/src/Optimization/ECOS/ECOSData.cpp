// Ticket: 0004_chebyshev_center_ecos

#include "wsa-core/src/Optimization/ECOS/ECOSData.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace wsa_core
{

namespace
{

std::string sizeMismatch(const char* what, idxint expected, size_t actual)
{
  return std::string{"ECOSData::setup: "} + what + " size mismatch (expected " +
         std::to_string(expected) + ", got " + std::to_string(actual) + ")";
}

}  // namespace

void ECOSWorkspaceDeleter::operator()(pwork* w) const noexcept
{
  if (w != nullptr)
  {
    ECOS_cleanup(w, 0);
  }
}

ECOSData::ECOSData(idxint numVariables, idxint numInequality)
  : num_variables_{numVariables}, num_inequality_{numInequality}
{
  h_.reserve(static_cast<size_t>(numInequality));
  c_.reserve(static_cast<size_t>(numVariables));
}

ECOSData::ECOSData(ECOSData&& other) noexcept
  : num_variables_{other.num_variables_},
    num_inequality_{other.num_inequality_},
    G_{std::move(other.G_)},
    h_{std::move(other.h_)},
    c_{std::move(other.c_)},
    workspace_{std::move(other.workspace_)}
{
}

ECOSData& ECOSData::operator=(ECOSData&& other) noexcept
{
  if (this != &other)
  {
    // ECOS_cleanup() writes to the arrays the workspace points at, so release
    // it before those arrays are replaced
    cleanup();

    num_variables_ = other.num_variables_;
    num_inequality_ = other.num_inequality_;
    G_ = std::move(other.G_);
    h_ = std::move(other.h_);
    c_ = std::move(other.c_);
    workspace_ = std::move(other.workspace_);
  }
  return *this;
}

void ECOSData::setup()
{
  if (workspace_ != nullptr)
  {
    throw std::runtime_error(
      "ECOSData::setup: workspace already set up (call cleanup() first)");
  }

  if (G_.nnz == 0)
  {
    throw std::runtime_error("ECOSData::setup: G matrix is empty (nnz == 0)");
  }

  if (G_.nrows != num_inequality_ || G_.ncols != num_variables_)
  {
    throw std::runtime_error(
      "ECOSData::setup: G is " + std::to_string(G_.nrows) + " x " +
      std::to_string(G_.ncols) + ", expected " +
      std::to_string(num_inequality_) + " x " + std::to_string(num_variables_));
  }

  if (static_cast<idxint>(h_.size()) != num_inequality_)
  {
    throw std::runtime_error(sizeMismatch("h", num_inequality_, h_.size()));
  }

  if (static_cast<idxint>(c_.size()) != num_variables_)
  {
    throw std::runtime_error(sizeMismatch("c", num_variables_, c_.size()));
  }

  // All rows in the positive orthant; no cones, no equality block
  pwork* raw = ECOS_setup(num_variables_,   // n
                          num_inequality_,  // m
                          0,                // p
                          num_inequality_,  // l
                          0,                // ncones
                          nullptr,          // cone dimensions
                          0,                // exponential cones
                          G_.data.data(),
                          G_.col_ptrs.data(),
                          G_.row_indices.data(),
                          nullptr,
                          nullptr,
                          nullptr,
                          c_.data(),
                          h_.data(),
                          nullptr);

  if (raw == nullptr)
  {
    throw std::runtime_error("ECOS_setup failed: invalid problem data");
  }

  workspace_.reset(raw);
}

void ECOSData::cleanup()
{
  workspace_.reset();
}

}  // namespace wsa_core
