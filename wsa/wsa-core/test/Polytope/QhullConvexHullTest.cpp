#include "wsa-core/src/Polytope/QhullConvexHull.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <set>
#include <stdexcept>

namespace wsa_core {

namespace {

Eigen::MatrixXd unitCubeCorners()
{
  Eigen::MatrixXd points(8, 3);
  points << 0, 0, 0,
            1, 0, 0,
            0, 1, 0,
            1, 1, 0,
            0, 0, 1,
            1, 0, 1,
            0, 1, 1,
            1, 1, 1;
  return points;
}

/// Corners of the unit hypercube in dim dimensions, bit j of row k is coord j
Eigen::MatrixXd unitHypercubeCorners(int dim)
{
  const int count = 1 << dim;
  Eigen::MatrixXd points(count, dim);
  for (int k = 0; k < count; ++k)
  {
    for (int j = 0; j < dim; ++j)
    {
      points(k, j) = ((k >> j) & 1) != 0 ? 1.0 : 0.0;
    }
  }
  return points;
}

}  // namespace

TEST(QhullConvexHullTest, SquareHasFourEdgesAndUnitArea)
{
  Eigen::MatrixXd points(5, 2);
  points << 0, 0,
            1, 0,
            0, 1,
            1, 1,
            0.5, 0.5;  // interior point

  const QhullConvexHull hull;
  const HullResult result = hull.compute(points);

  EXPECT_EQ(result.facetIndices.rows(), 4);
  EXPECT_EQ(result.facetIndices.cols(), 2);
  EXPECT_NEAR(result.volume, 1.0, 1e-9);

  // The interior point is never a facet vertex
  EXPECT_FALSE((result.facetIndices.array() == 4).any());
}

TEST(QhullConvexHullTest, CubeIsTriangulated)
{
  const QhullConvexHull hull;
  const HullResult result = hull.compute(unitCubeCorners());

  // Six square faces, two triangles each
  EXPECT_EQ(result.facetIndices.rows(), 12);
  EXPECT_EQ(result.facetIndices.cols(), 3);
  EXPECT_NEAR(result.volume, 1.0, 1e-9);

  for (Eigen::Index f = 0; f < result.facetIndices.rows(); ++f)
  {
    std::set<int> distinct;
    for (Eigen::Index j = 0; j < 3; ++j)
    {
      const int index = result.facetIndices(f, j);
      EXPECT_GE(index, 0);
      EXPECT_LT(index, 8);
      distinct.insert(index);
    }
    EXPECT_EQ(distinct.size(), 3u);
  }
}

TEST(QhullConvexHullTest, FiveDimensionalHypercube)
{
  const QhullConvexHull hull;
  const HullResult result = hull.compute(unitHypercubeCorners(5));

  ASSERT_GT(result.facetIndices.rows(), 0);
  EXPECT_EQ(result.facetIndices.cols(), 5);
  EXPECT_NEAR(result.volume, 1.0, 1e-9);
  EXPECT_GE(result.facetIndices.minCoeff(), 0);
  EXPECT_LT(result.facetIndices.maxCoeff(), 32);

  for (Eigen::Index f = 0; f < result.facetIndices.rows(); ++f)
  {
    // Each simplex lies on one face of the cube: some coordinate is constant
    const Eigen::VectorXi row = result.facetIndices.row(f).transpose();
    int commonOnes = 31;
    int commonZeros = 31;
    for (Eigen::Index j = 0; j < row.size(); ++j)
    {
      commonOnes &= row[j];
      commonZeros &= ~row[j];
    }
    EXPECT_TRUE(commonOnes != 0 || commonZeros != 0) << "facet " << f;
  }
}

TEST(QhullConvexHullTest, IntervalHullInOneDimension)
{
  Eigen::MatrixXd points(4, 1);
  points << 0.5, -2.0, 3.0, 1.0;

  const QhullConvexHull hull;
  const HullResult result = hull.compute(points);

  ASSERT_EQ(result.facetIndices.rows(), 2);
  ASSERT_EQ(result.facetIndices.cols(), 1);
  EXPECT_EQ(result.facetIndices(0, 0), 1);
  EXPECT_EQ(result.facetIndices(1, 0), 2);
  EXPECT_NEAR(result.volume, 5.0, 1e-12);
}

TEST(QhullConvexHullTest, CoincidentIntervalThrows)
{
  Eigen::MatrixXd points = Eigen::MatrixXd::Constant(3, 1, 2.0);

  const QhullConvexHull hull;
  EXPECT_THROW((void)hull.compute(points), std::runtime_error);
}

TEST(QhullConvexHullTest, EmptyInputThrows)
{
  const QhullConvexHull hull;
  EXPECT_THROW((void)hull.compute(Eigen::MatrixXd(0, 3)), std::runtime_error);
}

TEST(QhullConvexHullTest, TooFewPointsThrows)
{
  Eigen::MatrixXd points(3, 3);
  points << 0, 0, 0,
            1, 0, 0,
            0, 1, 0;

  const QhullConvexHull hull;
  EXPECT_THROW((void)hull.compute(points), std::runtime_error);
}

TEST(QhullConvexHullTest, FlatCloudThrows)
{
  // Four coplanar points in 3D have no full-dimensional hull
  Eigen::MatrixXd points(4, 3);
  points << 0, 0, 0,
            1, 0, 0,
            0, 1, 0,
            1, 1, 0;

  const QhullConvexHull hull;
  EXPECT_THROW((void)hull.compute(points), std::runtime_error);
}

}  // namespace wsa_core
