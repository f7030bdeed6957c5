// Ticket: 0004_chebyshev_center_ecos
// Ticket: 0005_max_radius_sphere_nlopt
// Ticket: 0006_coriolis_margin

#include "wsa-core/src/Sphere/SphereApproximator.hpp"

#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "wsa-core/src/Optimization/ECOS/ECOSLinearProgramSolver.hpp"
#include "wsa-core/src/Optimization/NLoptConstrainedOptimizer.hpp"
#include "wsa-core/src/Sphere/CoriolisMargin.hpp"

namespace wsa_core
{

SphereApproximator::SphereApproximator()
  : SphereApproximator{Config{}}
{
}

SphereApproximator::SphereApproximator(const Config& config)
  : SphereApproximator{config,
                       std::make_shared<ECOSLinearProgramSolver>(),
                       std::make_shared<NLoptConstrainedOptimizer>()}
{
}

SphereApproximator::SphereApproximator(
  const Config& config,
  std::shared_ptr<const LinearProgramSolver> lpSolver,
  std::shared_ptr<const ConstrainedOptimizer> optimizer)
  : config_{config},
    lpSolver_{std::move(lpSolver)},
    optimizer_{std::move(optimizer)}
{
  if (!lpSolver_)
  {
    throw std::invalid_argument{
      "SphereApproximator: linear program solver must not be null"};
  }
  if (!optimizer_)
  {
    throw std::invalid_argument{
      "SphereApproximator: constrained optimizer must not be null"};
  }
}

BoundingSphere SphereApproximator::sphereApproximationCapacity(
  const WrenchPolytope& polytope,
  const Eigen::VectorXd& G) const
{
  requireNonEmpty(polytope, "sphereApproximationCapacity");
  requireDimension(polytope, G, "sphereApproximationCapacity");

  const Eigen::MatrixXd& A = polytope.getA();
  const Eigen::VectorXd margins =
    (polytope.getB() - A * G).cwiseQuotient(A.rowwise().norm());

  return BoundingSphere{G, margins.minCoeff()};
}

SphereApproximationResult SphereApproximator::sphereApproximationChebyshev(
  const WrenchPolytope& polytope) const
{
  requireNonEmpty(polytope, "sphereApproximationChebyshev");

  const Eigen::MatrixXd& A = polytope.getA();
  const Eigen::Index n = A.cols();

  // Variables [o; r]: A_i o + |A_i| r <= b_i, maximize r
  Eigen::MatrixXd G(A.rows(), n + 1);
  G.leftCols(n) = A;
  G.col(n) = A.rowwise().norm();

  Eigen::VectorXd c = Eigen::VectorXd::Zero(n + 1);
  c[n] = -1.0;

  const LinearProgramResult lp = lpSolver_->solve(c, G, polytope.getB());

  SphereApproximationResult result;
  result.converged = lp.converged;
  result.exitFlag = lp.exitFlag;
  result.iterations = lp.iterations;
  result.objectiveValue = lp.objective;
  result.message = lp.message;

  if (lp.x.size() == n + 1)
  {
    result.sphere = BoundingSphere{lp.x.head(n), lp.x[n]};
  }

  if (!result.converged)
  {
    spdlog::warn("SphereApproximator: Chebyshev center not found ({})",
                 result.message);
  }

  return result;
}

SphereApproximationResult SphereApproximator::sphereApproximationMax(
  const WrenchPolytope& polytope,
  const Eigen::VectorXd& xRef,
  double buffer) const
{
  requireNonEmpty(polytope, "sphereApproximationMax");
  requireDimension(polytope, xRef, "sphereApproximationMax");

  const Eigen::MatrixXd& A = polytope.getA();
  const Eigen::VectorXd& b = polytope.getB();
  const Eigen::Index n = A.cols();
  const Eigen::Index k = A.rows();

  // Epigraph form over z = [c; r]. At the optimum r equals the capacity
  // radius min_i (b_i - A_i c) / |A_i|.
  ConstrainedProblem problem;
  problem.objective = [n](const Eigen::VectorXd& z, Eigen::VectorXd* grad)
  {
    if (grad != nullptr)
    {
      grad->setZero();
      (*grad)[n] = -1.0;
    }
    return -z[n];
  };

  problem.A = Eigen::MatrixXd::Zero(2 * k, n + 1);
  problem.A.topLeftCorner(k, n) = A;
  problem.A.topRightCorner(k, 1) = A.rowwise().norm();
  problem.A.bottomLeftCorner(k, n) = A;  // center inside the polytope
  problem.b.resize(2 * k);
  problem.b << b, b;

  problem.inequalities.emplace_back(
    [n, xRef, buffer](const Eigen::VectorXd& z, Eigen::VectorXd* grad)
    {
      const Eigen::VectorXd d = z.head(n) - xRef;
      const double dist = d.norm();
      if (grad != nullptr)
      {
        grad->setZero();
        if (dist > 0.0)
        {
          grad->head(n) = d / dist;
        }
        (*grad)[n] = -1.0;
      }
      return dist + buffer - z[n];
    });

  problem.initialGuess = Eigen::VectorXd::Zero(n + 1);

  const OptimizationResult opt = optimizer_->minimize(problem);

  SphereApproximationResult result;
  result.converged = opt.converged;
  result.exitFlag = opt.status;
  result.iterations = opt.evaluations;
  result.objectiveValue = opt.objective;
  result.message = opt.message;
  if (opt.x.size() == n + 1)
  {
    result.sphere = BoundingSphere{opt.x.head(n), -opt.objective};
  }

  if (!result.converged)
  {
    spdlog::warn("SphereApproximator: max-radius sphere not found ({})",
                 result.message);
  }

  return result;
}

BoundingSphere SphereApproximator::sphereApproximationCoriolis(
  const WrenchPolytope& polytope,
  const Eigen::VectorXd& G,
  double q2) const
{
  requireNonEmpty(polytope, "sphereApproximationCoriolis");
  requireDimension(polytope, G, "sphereApproximationCoriolis");

  const double radius = provisional::computeCoriolisMargin(
    polytope, G, q2, config_.coriolisZeroTolerance);
  return BoundingSphere{G, radius};
}

void SphereApproximator::requireNonEmpty(const WrenchPolytope& polytope,
                                         const char* caller)
{
  if (polytope.isEmpty())
  {
    throw std::invalid_argument{std::string{"SphereApproximator::"} + caller +
                                ": polytope has no feasible half-spaces"};
  }
}

void SphereApproximator::requireDimension(const WrenchPolytope& polytope,
                                          const Eigen::VectorXd& w,
                                          const char* caller)
{
  if (w.size() != polytope.getDimension())
  {
    std::ostringstream oss;
    oss << "SphereApproximator::" << caller << ": wrench size " << w.size()
        << " does not match polytope dimension " << polytope.getDimension();
    throw std::invalid_argument{oss.str()};
  }
}

}  // namespace wsa_core
