// Ticket: 0003_polytope_builder

#include "wsa-core/src/Polytope/PolytopeBuilder.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "wsa-core/src/Polytope/QhullConvexHull.hpp"
#include "wsa-core/src/Polytope/WrenchVertexEnumerator.hpp"
#include "wsa-core/src/Utils/utils.hpp"

namespace wsa_core
{

const char* toString(BuildStatus status)
{
  switch (status)
  {
    case BuildStatus::Success:
      return "Success";
    case BuildStatus::DegenerateInput:
      return "DegenerateInput";
    case BuildStatus::HullFailure:
      return "HullFailure";
    case BuildStatus::NoOrientingVertex:
      return "NoOrientingVertex";
    case BuildStatus::TimedOut:
      return "TimedOut";
  }
  return "Unknown";
}

PolytopeBuilder::PolytopeBuilder() : PolytopeBuilder{Config{}}
{
}

PolytopeBuilder::PolytopeBuilder(const Config& config)
  : PolytopeBuilder{config, std::make_shared<QhullConvexHull>()}
{
}

PolytopeBuilder::PolytopeBuilder(
  const Config& config,
  std::shared_ptr<const ConvexHullBackend> hullBackend)
  : config_{config}, hullBackend_{std::move(hullBackend)}
{
  if (hullBackend_ == nullptr)
  {
    throw std::invalid_argument{"PolytopeBuilder: hull backend must not be null"};
  }
}

BuildResult PolytopeBuilder::build(const Eigen::MatrixXd& As,
                                   const Eigen::VectorXd& F_u,
                                   const Eigen::VectorXd& F_l,
                                   const Eigen::VectorXd& offset) const
{
  return build(ActuationModel{As, F_u, F_l, offset});
}

BuildResult PolytopeBuilder::build(const ActuationModel& model) const
{
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  auto expired = [&]()
  {
    return config_.timeout.count() > 0 &&
           Clock::now() - start > config_.timeout;
  };

  // Throws before anything is allocated if m is intractable
  const WrenchVertexEnumerator enumerator{model, config_.maxActuators};

  // Steps 1-2: enumerate bound-extreme combinations in wrench space
  const Eigen::MatrixXd W = enumerator.enumerate();
  const Eigen::Index n = W.cols();

  if (expired())
  {
    return failure(BuildStatus::TimedOut,
                   "timeout elapsed after vertex enumeration");
  }

  const double spread = (W.rowwise() - W.row(0)).cwiseAbs().maxCoeff();
  if (isNearZero(spread, config_.degeneracyTolerance))
  {
    return failure(BuildStatus::DegenerateInput,
                   "all enumerated wrenches coincide");
  }

  // Step 3: convex hull
  HullResult hull;
  try
  {
    hull = hullBackend_->compute(W);
  }
  catch (const std::exception& e)
  {
    return failure(BuildStatus::HullFailure, e.what());
  }

  if (expired())
  {
    return failure(BuildStatus::TimedOut,
                   "timeout elapsed after convex hull computation");
  }

  const Eigen::MatrixXi& K = hull.facetIndices;
  const Eigen::Index numFaces = K.rows();
  const Eigen::Index nShape = K.cols();

  // Facet table must be numFaces x n with every entry a row of W
  if (numFaces > 0 && nShape != n)
  {
    std::ostringstream oss;
    oss << "hull facets have " << nShape << " vertices, expected " << n;
    return failure(BuildStatus::HullFailure, oss.str());
  }
  if (numFaces > 0 && (K.minCoeff() < 0 || K.maxCoeff() >= W.rows()))
  {
    std::ostringstream oss;
    oss << "hull facet index outside [0, " << W.rows() << ")";
    return failure(BuildStatus::HullFailure, oss.str());
  }

  // Step 4: facets to oriented half-spaces
  std::vector<Eigen::VectorXd> normals;
  std::vector<double> offsets;
  normals.reserve(static_cast<size_t>(numFaces));
  offsets.reserve(static_cast<size_t>(numFaces));

  Eigen::Index skipped = 0;
  for (Eigen::Index f = 0; f < numFaces; ++f)
  {
    if (expired())
    {
      return failure(BuildStatus::TimedOut,
                     "timeout elapsed while converting hull facets");
    }

    const auto firstVertex = static_cast<Eigen::Index>(K(f, 0));

    // Edge vectors from the first facet vertex
    Eigen::MatrixXd Wi(nShape - 1, n);
    for (Eigen::Index j = 1; j < nShape; ++j)
    {
      Wi.row(j - 1) = W.row(K(f, j)) - W.row(firstVertex);
    }

    const Eigen::MatrixXd basis = nullSpace(Wi);
    if (basis.cols() != 1)
    {
      // Facet does not define a unique hyperplane
      spdlog::debug("PolytopeBuilder: facet {} skipped (null space dimension {})",
                    f, basis.cols());
      ++skipped;
      continue;
    }

    Eigen::VectorXd Ti = basis.col(0);
    double bi = Ti.dot(W.row(firstVertex).transpose());

    // Orient against the first vertex lying strictly off the hyperplane
    std::optional<Eigen::Index> orientingVertex;
    for (Eigen::Index j = 0; j < W.rows(); ++j)
    {
      if ((K.row(f).array() == static_cast<int>(j)).any())
      {
        continue;
      }
      const double value = Ti.dot(W.row(j).transpose());
      if (std::abs(value - bi) > config_.orientationTolerance)
      {
        orientingVertex = j;
        break;
      }
    }

    if (!orientingVertex.has_value())
    {
      std::ostringstream oss;
      oss << "facet " << f << " has no vertex off its hyperplane";
      return failure(BuildStatus::NoOrientingVertex, oss.str());
    }

    if (Ti.dot(W.row(*orientingVertex).transpose()) > bi)
    {
      Ti = -Ti;
      bi = -bi;
    }

    normals.push_back(std::move(Ti));
    offsets.push_back(bi);
  }

  // Step 5: collect retained half-spaces in facet order
  const auto numHalfSpaces = static_cast<Eigen::Index>(normals.size());
  Eigen::MatrixXd A(numHalfSpaces, n);
  Eigen::VectorXd b(numHalfSpaces);
  for (Eigen::Index i = 0; i < numHalfSpaces; ++i)
  {
    A.row(i) = normals[static_cast<size_t>(i)].transpose();
    b[i] = offsets[static_cast<size_t>(i)];
  }

  spdlog::debug(
    "PolytopeBuilder: {} vertices, {} hull facets, {} half-spaces ({} "
    "degenerate facets skipped), volume {}",
    W.rows(), numFaces, numHalfSpaces, skipped, hull.volume);

  BuildResult result;
  result.status = BuildStatus::Success;
  result.polytope = WrenchPolytope{numFaces,
                                   std::move(A),
                                   std::move(b),
                                   hull.volume,
                                   W,
                                   K};
  return result;
}

Eigen::MatrixXd PolytopeBuilder::nullSpace(const Eigen::MatrixXd& M)
{
  const Eigen::Index cols = M.cols();
  if (M.rows() == 0)
  {
    return Eigen::MatrixXd::Identity(cols, cols);
  }

  const Eigen::JacobiSVD<Eigen::MatrixXd> svd(M, Eigen::ComputeFullV);
  const Eigen::VectorXd& sigma = svd.singularValues();

  const double sigmaMax = sigma.size() > 0 ? sigma[0] : 0.0;
  const double tol = static_cast<double>(std::max(M.rows(), cols)) *
                     std::numeric_limits<double>::epsilon() * sigmaMax;

  const auto rank = static_cast<Eigen::Index>((sigma.array() > tol).count());

  // Singular values are sorted in decreasing order, so the trailing columns
  // of V span the null space
  return svd.matrixV().rightCols(cols - rank);
}

BuildResult PolytopeBuilder::failure(BuildStatus status, std::string reason)
{
  spdlog::warn("PolytopeBuilder: build failed ({}): {}", toString(status), reason);

  BuildResult result;
  result.status = status;
  result.reason = std::move(reason);
  return result;
}

}  // namespace wsa_core
