// Ticket: 0004_chebyshev_center_ecos

#include "wsa-core/src/Optimization/ECOS/ECOSLinearProgramSolver.hpp"

#include <spdlog/spdlog.h>

#include "wsa-core/src/Optimization/ECOS/ECOSProblemBuilder.hpp"

namespace wsa_core
{

ECOSLinearProgramSolver::ECOSLinearProgramSolver()
  : ECOSLinearProgramSolver{Config{}}
{
}

ECOSLinearProgramSolver::ECOSLinearProgramSolver(const Config& config)
  : config_{config}
{
}

LinearProgramResult ECOSLinearProgramSolver::solve(
  const Eigen::VectorXd& c,
  const Eigen::MatrixXd& G,
  const Eigen::VectorXd& h) const
{
  ECOSData data = ECOSProblemBuilder::buildLinearProgram(c, G, h);
  return solve(data);
}

LinearProgramResult ECOSLinearProgramSolver::solve(ECOSData& data) const
{
  if (!data.isSetup())
  {
    data.setup();
  }

  pwork* workspace = data.workspace_.get();
  workspace->stgs->maxit = static_cast<idxint>(config_.maxIterations);
  workspace->stgs->abstol = config_.absTolerance;
  workspace->stgs->reltol = config_.relTolerance;
  workspace->stgs->feastol = config_.feasTolerance;

  // Suppress ECOS stdout output
  workspace->stgs->verbose = 0;

  const idxint exitFlag = ECOS_solve(workspace);

  LinearProgramResult result;
  result.x = Eigen::Map<const Eigen::VectorXd>(
    workspace->x, static_cast<Eigen::Index>(data.num_variables_));
  result.objective = workspace->info->pcost;
  result.converged = (exitFlag == ECOS_OPTIMAL);
  result.exitFlag = static_cast<int>(exitFlag);
  result.iterations = static_cast<int>(workspace->info->iter);
  result.primalResidual = workspace->info->pres;
  result.dualResidual = workspace->info->dres;
  result.gap = workspace->info->gap;
  result.message = describeExitFlag(exitFlag);

  if (!result.converged)
  {
    spdlog::warn("ECOSLinearProgramSolver: solve did not converge (exit {}: {})",
                 result.exitFlag, result.message);
  }

  // ECOSData destructor handles ECOS_cleanup via unique_ptr
  return result;
}

const char* ECOSLinearProgramSolver::describeExitFlag(idxint exitFlag)
{
  switch (exitFlag)
  {
    case ECOS_OPTIMAL:
      return "optimal";
    case ECOS_PINF:
      return "primal infeasible";
    case ECOS_DINF:
      return "dual infeasible (unbounded)";
    case ECOS_OPTIMAL + ECOS_INACC_OFFSET:
      return "close to optimal";
    case ECOS_PINF + ECOS_INACC_OFFSET:
      return "close to primal infeasible";
    case ECOS_DINF + ECOS_INACC_OFFSET:
      return "close to dual infeasible";
    case ECOS_MAXIT:
      return "maximum iterations reached";
    case ECOS_NUMERICS:
      return "numerical problems";
    case ECOS_OUTCONE:
      return "iterate left the cone";
    case ECOS_SIGINT:
      return "interrupted";
    case ECOS_FATAL:
      return "fatal error";
    default:
      return "unknown exit flag";
  }
}

}  // namespace wsa_core
