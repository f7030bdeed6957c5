// Ticket: 0007_builder_benchmark

#include <benchmark/benchmark.h>
#include <Eigen/Dense>
#include <random>

#include "wsa-core/src/Actuation/ActuationModel.hpp"
#include "wsa-core/src/Polytope/PolytopeBuilder.hpp"
#include "wsa-core/src/Polytope/WrenchVertexEnumerator.hpp"
#include "wsa-core/src/Sphere/SphereApproximator.hpp"

using namespace wsa_core;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Random actuation model with unilateral (cable-like) bounds
ActuationModel generateActuationModel(Eigen::Index dofs, Eigen::Index actuators)
{
  std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::uniform_real_distribution<double> dist{-1.0, 1.0};

  Eigen::MatrixXd As(dofs, actuators);
  for (Eigen::Index i = 0; i < dofs; ++i)
  {
    for (Eigen::Index j = 0; j < actuators; ++j)
    {
      As(i, j) = dist(rng);
    }
  }

  return ActuationModel{As,
                        Eigen::VectorXd::Constant(actuators, 10.0),
                        Eigen::VectorXd::Constant(actuators, 0.5)};
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Benchmark bound-extreme vertex enumeration
 *
 * Enumeration is exponential in the actuator count; this isolates it from
 * the hull so the two costs can be compared.
 */
static void BM_WrenchVertexEnumerator_Enumerate(benchmark::State& state)
{
  const auto model = generateActuationModel(3, state.range(0));
  const WrenchVertexEnumerator enumerator{model, 20};
  for (auto _ : state)
  {
    Eigen::MatrixXd W = enumerator.enumerate();
    benchmark::DoNotOptimize(W.data());
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_WrenchVertexEnumerator_Enumerate)
  ->Args({4})
  ->Args({8})
  ->Args({12})
  ->Args({16})
  ->Complexity();

/**
 * @brief Benchmark full polytope construction in 3D wrench space
 *
 * Covers enumeration, Qhull and the per-facet null-space/orientation pass.
 */
static void BM_PolytopeBuilder_Build3D(benchmark::State& state)
{
  const auto model = generateActuationModel(3, state.range(0));
  const PolytopeBuilder builder;
  for (auto _ : state)
  {
    BuildResult result = builder.build(model);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_PolytopeBuilder_Build3D)
  ->Args({4})   // Minimal redundancy
  ->Args({6})   // Typical planar cable robot
  ->Args({8})   // Spatial cable robot
  ->Args({12})
  ->Complexity();

/**
 * @brief Benchmark polytope construction in 6D wrench space
 *
 * Qhull runs with exact pre-merges (Qx) from 5D upwards.
 */
static void BM_PolytopeBuilder_Build6D(benchmark::State& state)
{
  const auto model = generateActuationModel(6, state.range(0));
  const PolytopeBuilder builder;
  for (auto _ : state)
  {
    BuildResult result = builder.build(model);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_PolytopeBuilder_Build6D)
  ->Args({7})
  ->Args({8})
  ->Args({10});

/**
 * @brief Benchmark the Chebyshev-center LP on a built polytope
 */
static void BM_SphereApproximator_Chebyshev(benchmark::State& state)
{
  const auto model = generateActuationModel(3, state.range(0));
  const BuildResult built = PolytopeBuilder{}.build(model);
  if (!built.ok())
  {
    state.SkipWithError(built.reason.c_str());
    return;
  }

  const SphereApproximator approximator;
  for (auto _ : state)
  {
    SphereApproximationResult result =
      approximator.sphereApproximationChebyshev(built.polytope);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_SphereApproximator_Chebyshev)
  ->Args({6})
  ->Args({12});

BENCHMARK_MAIN();
