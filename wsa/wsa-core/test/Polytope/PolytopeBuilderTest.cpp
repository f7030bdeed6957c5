// Ticket: 0003_polytope_builder

#include "wsa-core/src/Polytope/PolytopeBuilder.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "wsa-core/test/Helpers/PolytopeFixtures.hpp"

namespace wsa_core {

namespace {

/// Backend returning a fixed facet table
class FixedHullBackend : public ConvexHullBackend
{
public:
  explicit FixedHullBackend(Eigen::MatrixXi facets,
                            std::chrono::milliseconds delay = std::chrono::milliseconds{0})
    : facets_{std::move(facets)}, delay_{delay}
  {
  }

  HullResult compute(const Eigen::MatrixXd& /* points */) const override
  {
    if (delay_.count() > 0)
    {
      std::this_thread::sleep_for(delay_);
    }
    HullResult result;
    result.facetIndices = facets_;
    result.volume = 1.0;
    return result;
  }

private:
  Eigen::MatrixXi facets_;
  std::chrono::milliseconds delay_;
};

/// Backend that always fails
class ThrowingHullBackend : public ConvexHullBackend
{
public:
  HullResult compute(const Eigen::MatrixXd& /* points */) const override
  {
    throw std::runtime_error{"hull backend unavailable"};
  }
};

Eigen::MatrixXi squareFacets()
{
  // Facets of the identity-structure square in enumeration order:
  // 0 = (-1,-1), 1 = (-1,1), 2 = (1,-1), 3 = (1,1)
  Eigen::MatrixXi facets(4, 2);
  facets << 2, 3,
            0, 1,
            1, 3,
            0, 2;
  return facets;
}

/// Number of rows of A matching the half-space normal . w <= offset
int countHalfSpace(const WrenchPolytope& polytope,
                   const Eigen::VectorXd& normal,
                   double offset)
{
  int count = 0;
  for (Eigen::Index i = 0; i < polytope.getHalfSpaceCount(); ++i)
  {
    const double scale = polytope.getA().row(i).norm();
    const Eigen::VectorXd unit = polytope.getA().row(i).transpose() / scale;
    if (unit.isApprox(normal, 1e-9) &&
        std::abs(polytope.getB()[i] / scale - offset) < 1e-9)
    {
      ++count;
    }
  }
  return count;
}

}  // namespace

TEST(PolytopeBuilderTest, IdentityStructureGivesUnitSquare)
{
  const PolytopeBuilder builder;
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  ASSERT_TRUE(result.ok()) << result.reason;
  const WrenchPolytope& polytope = result.polytope;

  EXPECT_EQ(polytope.getFaceCount(), 4);
  EXPECT_EQ(polytope.getHalfSpaceCount(), 4);
  EXPECT_NEAR(polytope.getVolume(), 4.0, 1e-9);

  EXPECT_EQ(countHalfSpace(polytope, Eigen::Vector2d{1.0, 0.0}, 1.0), 1);
  EXPECT_EQ(countHalfSpace(polytope, Eigen::Vector2d{-1.0, 0.0}, 1.0), 1);
  EXPECT_EQ(countHalfSpace(polytope, Eigen::Vector2d{0.0, 1.0}, 1.0), 1);
  EXPECT_EQ(countHalfSpace(polytope, Eigen::Vector2d{0.0, -1.0}, 1.0), 1);
}

TEST(PolytopeBuilderTest, EveryVertexSatisfiesEveryHalfSpace)
{
  Eigen::MatrixXd As(3, 5);
  As << 1.0, 0.5, -0.3, 0.0, 0.8,
        0.2, -1.0, 0.7, 0.4, 0.0,
        -0.6, 0.1, 0.9, -1.0, 0.3;
  Eigen::VectorXd F_u(5);
  F_u << 2.0, 1.5, 3.0, 1.0, 2.5;
  Eigen::VectorXd F_l(5);
  F_l << 0.1, -1.0, 0.0, -0.5, 0.2;
  Eigen::VectorXd offset(3);
  offset << 0.3, -0.2, 1.0;

  const PolytopeBuilder builder;
  const BuildResult result = builder.build(As, F_u, F_l, offset);

  ASSERT_TRUE(result.ok()) << result.reason;
  const WrenchPolytope& polytope = result.polytope;
  ASSERT_GT(polytope.getHalfSpaceCount(), 0);
  EXPECT_GT(polytope.getVolume(), 0.0);

  const Eigen::MatrixXd& W = polytope.getWrenchCombinations();
  ASSERT_EQ(W.rows(), 32);
  for (Eigen::Index k = 0; k < W.rows(); ++k)
  {
    const Eigen::VectorXd w = W.row(k).transpose();
    EXPECT_TRUE(polytope.contains(w, 1e-6)) << "vertex " << k;
  }

  // Mean of the vertices is strictly inside
  const Eigen::VectorXd centroid = W.colwise().mean().transpose();
  EXPECT_LT(polytope.signedDistance(centroid), 0.0);
}

TEST(PolytopeBuilderTest, FiveDimensionalWrenchSpaceContainsEveryVertex)
{
  // Six actuators into a 5-D wrench space, hull computed with Qx
  Eigen::MatrixXd As(5, 6);
  As << 1.0, 0.0, 0.0, 0.0, 0.0, 0.5,
        0.0, 1.0, 0.0, 0.0, 0.0, -0.4,
        0.0, 0.0, 1.0, 0.0, 0.0, 0.3,
        0.0, 0.0, 0.0, 1.0, 0.0, -0.2,
        0.0, 0.0, 0.0, 0.0, 1.0, 0.6;
  Eigen::VectorXd F_u(6);
  F_u << 1.0, 2.0, 1.5, 1.0, 0.8, 1.2;
  Eigen::VectorXd F_l(6);
  F_l << -1.0, 0.0, -0.5, 0.2, -0.8, -1.2;

  const PolytopeBuilder builder;
  const BuildResult result = builder.build(As, F_u, F_l);

  ASSERT_TRUE(result.ok()) << result.reason;
  const WrenchPolytope& polytope = result.polytope;
  EXPECT_EQ(polytope.getDimension(), 5);
  ASSERT_GT(polytope.getHalfSpaceCount(), 0);
  EXPECT_GT(polytope.getVolume(), 0.0);

  const Eigen::MatrixXd& W = polytope.getWrenchCombinations();
  ASSERT_EQ(W.rows(), 64);
  for (Eigen::Index k = 0; k < W.rows(); ++k)
  {
    const Eigen::VectorXd w = W.row(k).transpose();
    EXPECT_TRUE(polytope.contains(w, 1e-6)) << "vertex " << k;
  }

  const Eigen::VectorXd centroid = W.colwise().mean().transpose();
  EXPECT_LT(polytope.signedDistance(centroid), 0.0);
}

TEST(PolytopeBuilderTest, RebuildGivesIdenticalHalfSpaces)
{
  Eigen::MatrixXd As(2, 3);
  As << 1.0, -0.5, 0.2,
        0.3, 1.0, -0.8;

  const PolytopeBuilder builder;
  const BuildResult first = builder.build(As, Eigen::VectorXd::Ones(3),
                                          Eigen::VectorXd::Zero(3));
  const BuildResult second = builder.build(As, Eigen::VectorXd::Ones(3),
                                           Eigen::VectorXd::Zero(3));

  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  ASSERT_EQ(first.polytope.getHalfSpaceCount(),
            second.polytope.getHalfSpaceCount());

  for (Eigen::Index i = 0; i < first.polytope.getHalfSpaceCount(); ++i)
  {
    const Eigen::VectorXd normal =
      first.polytope.getA().row(i).transpose() / first.polytope.getA().row(i).norm();
    const double offset =
      first.polytope.getB()[i] / first.polytope.getA().row(i).norm();
    EXPECT_GE(countHalfSpace(second.polytope, normal, offset), 1);
  }
}

TEST(PolytopeBuilderTest, EqualBoundsGiveDegenerateInput)
{
  const PolytopeBuilder builder;
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::DegenerateInput);
  EXPECT_FALSE(result.ok());
  EXPECT_FALSE(result.reason.empty());
  EXPECT_TRUE(result.polytope.isEmpty());
  EXPECT_EQ(result.polytope.getFaceCount(), 0);
}

TEST(PolytopeBuilderTest, HullFailureIsReportedNotThrown)
{
  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<ThrowingHullBackend>()};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::HullFailure);
  EXPECT_EQ(result.reason, "hull backend unavailable");
  EXPECT_TRUE(result.polytope.isEmpty());
}

TEST(PolytopeBuilderTest, FlatCloudReportsHullFailure)
{
  // Both actuators push along the same direction: the cloud is a segment
  Eigen::MatrixXd As(2, 2);
  As << 1.0, 2.0,
        1.0, 2.0;

  const PolytopeBuilder builder;
  const BuildResult result = builder.build(As, Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::HullFailure);
  EXPECT_TRUE(result.polytope.isEmpty());
}

TEST(PolytopeBuilderTest, FacetWithoutOffPlaneVertexIsReported)
{
  // All vertices on the line w0 == w1; facet {0, 3} has no vertex off it
  Eigen::MatrixXd As(2, 2);
  As << 1.0, 2.0,
        1.0, 2.0;
  Eigen::MatrixXi facets(1, 2);
  facets << 0, 3;

  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<FixedHullBackend>(facets)};
  const BuildResult result = builder.build(As, Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::NoOrientingVertex);
  EXPECT_TRUE(result.polytope.isEmpty());
}

TEST(PolytopeBuilderTest, FacetTableWithWrongWidthIsHullFailure)
{
  Eigen::MatrixXi facets(2, 3);
  facets << 0, 1, 2,
            1, 2, 3;

  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<FixedHullBackend>(facets)};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::HullFailure);
  EXPECT_FALSE(result.reason.empty());
  EXPECT_TRUE(result.polytope.isEmpty());
}

TEST(PolytopeBuilderTest, FacetIndexOutOfRangeIsHullFailure)
{
  Eigen::MatrixXi facets = squareFacets();
  facets(2, 1) = 4;  // only vertices 0..3 exist

  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<FixedHullBackend>(facets)};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));
  EXPECT_EQ(result.status, BuildStatus::HullFailure);
  EXPECT_TRUE(result.polytope.isEmpty());

  facets(2, 1) = -1;
  const PolytopeBuilder negative{PolytopeBuilder::Config{},
                                 std::make_shared<FixedHullBackend>(facets)};
  EXPECT_EQ(negative.build(test::identityStructure(2),
                           Eigen::VectorXd::Ones(2),
                           -Eigen::VectorXd::Ones(2)).status,
            BuildStatus::HullFailure);
}

TEST(PolytopeBuilderTest, DegenerateFacetIsSkipped)
{
  Eigen::MatrixXi facets(5, 2);
  facets.topRows(4) = squareFacets();
  facets.row(4) << 1, 1;  // repeated vertex, no unique normal

  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<FixedHullBackend>(facets)};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  ASSERT_TRUE(result.ok()) << result.reason;
  EXPECT_EQ(result.polytope.getFaceCount(), 5);
  EXPECT_EQ(result.polytope.getHalfSpaceCount(), 4);
}

TEST(PolytopeBuilderTest, HalfSpacesFollowFacetOrder)
{
  const PolytopeBuilder builder{PolytopeBuilder::Config{},
                                std::make_shared<FixedHullBackend>(squareFacets())};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  ASSERT_TRUE(result.ok());
  const Eigen::MatrixXd& A = result.polytope.getA();
  ASSERT_EQ(A.rows(), 4);
  EXPECT_NEAR(A(0, 0), 1.0, 1e-12);   // w0 <= 1
  EXPECT_NEAR(A(1, 0), -1.0, 1e-12);  // -w0 <= 1
  EXPECT_NEAR(A(2, 1), 1.0, 1e-12);   // w1 <= 1
  EXPECT_NEAR(A(3, 1), -1.0, 1e-12);  // -w1 <= 1
  EXPECT_TRUE(result.polytope.getB().isApprox(Eigen::VectorXd::Ones(4)));
}

TEST(PolytopeBuilderTest, OneDimensionalWrenchGivesInterval)
{
  Eigen::MatrixXd As(1, 2);
  As << 1.0, -2.0;

  const PolytopeBuilder builder;
  const BuildResult result = builder.build(As, Eigen::VectorXd::Ones(2),
                                           Eigen::VectorXd::Zero(2));

  // Wrenches {0, -2, 1, -1}: interval [-2, 1]
  ASSERT_TRUE(result.ok()) << result.reason;
  EXPECT_EQ(result.polytope.getHalfSpaceCount(), 2);
  EXPECT_NEAR(result.polytope.getVolume(), 3.0, 1e-12);
  EXPECT_TRUE(result.polytope.contains(Eigen::VectorXd::Constant(1, -2.0)));
  EXPECT_TRUE(result.polytope.contains(Eigen::VectorXd::Constant(1, 1.0)));
  EXPECT_FALSE(result.polytope.contains(Eigen::VectorXd::Constant(1, 1.5)));
}

TEST(PolytopeBuilderTest, TimeoutIsReported)
{
  PolytopeBuilder::Config config;
  config.timeout = std::chrono::milliseconds{5};

  const PolytopeBuilder builder{
    config,
    std::make_shared<FixedHullBackend>(squareFacets(), std::chrono::milliseconds{50})};
  const BuildResult result = builder.build(test::identityStructure(2),
                                           Eigen::VectorXd::Ones(2),
                                           -Eigen::VectorXd::Ones(2));

  EXPECT_EQ(result.status, BuildStatus::TimedOut);
  EXPECT_TRUE(result.polytope.isEmpty());
}

TEST(PolytopeBuilderTest, TooManyActuatorsThrows)
{
  PolytopeBuilder::Config config;
  config.maxActuators = 3;
  const PolytopeBuilder builder{config};

  EXPECT_THROW((void)builder.build(Eigen::MatrixXd::Ones(2, 4),
                                   Eigen::VectorXd::Ones(4),
                                   Eigen::VectorXd::Zero(4)),
               std::invalid_argument);
}

TEST(PolytopeBuilderTest, InvalidInputThrows)
{
  const PolytopeBuilder builder;

  EXPECT_THROW((void)builder.build(Eigen::MatrixXd::Identity(2, 2),
                                   Eigen::VectorXd::Ones(3),
                                   Eigen::VectorXd::Zero(2)),
               std::invalid_argument);
  EXPECT_THROW((void)builder.build(Eigen::MatrixXd::Identity(2, 2),
                                   Eigen::VectorXd::Zero(2),
                                   Eigen::VectorXd::Ones(2)),
               std::invalid_argument);
}

TEST(PolytopeBuilderTest, NullBackendThrows)
{
  EXPECT_THROW((PolytopeBuilder{PolytopeBuilder::Config{}, nullptr}),
               std::invalid_argument);
}

TEST(PolytopeBuilderTest, NullSpaceOfEmptyMatrixIsIdentity)
{
  const Eigen::MatrixXd basis = PolytopeBuilder::nullSpace(Eigen::MatrixXd(0, 3));
  EXPECT_TRUE(basis.isApprox(Eigen::MatrixXd::Identity(3, 3)));
}

TEST(PolytopeBuilderTest, NullSpaceOfEdgeIsItsNormal)
{
  Eigen::MatrixXd edge(1, 2);
  edge << 2.0, 0.0;

  const Eigen::MatrixXd basis = PolytopeBuilder::nullSpace(edge);
  ASSERT_EQ(basis.cols(), 1);
  EXPECT_NEAR(std::abs(basis(1, 0)), 1.0, 1e-12);
  EXPECT_NEAR(basis(0, 0), 0.0, 1e-12);
}

TEST(PolytopeBuilderTest, NullSpaceOfZeroRowIsFull)
{
  const Eigen::MatrixXd basis = PolytopeBuilder::nullSpace(Eigen::MatrixXd::Zero(1, 2));
  EXPECT_EQ(basis.cols(), 2);
}

TEST(PolytopeBuilderTest, StatusNames)
{
  EXPECT_STREQ(toString(BuildStatus::Success), "Success");
  EXPECT_STREQ(toString(BuildStatus::DegenerateInput), "DegenerateInput");
  EXPECT_STREQ(toString(BuildStatus::HullFailure), "HullFailure");
  EXPECT_STREQ(toString(BuildStatus::NoOrientingVertex), "NoOrientingVertex");
  EXPECT_STREQ(toString(BuildStatus::TimedOut), "TimedOut");
}

}  // namespace wsa_core
