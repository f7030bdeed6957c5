#include "wsa-core/src/Actuation/ActuationModel.hpp"

#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <limits>
#include <stdexcept>

namespace wsa_core {

TEST(ActuationModelTest, EmptyOffsetDefaultsToZero)
{
  const ActuationModel model{Eigen::MatrixXd::Identity(2, 3),
                             Eigen::VectorXd::Ones(3),
                             -Eigen::VectorXd::Ones(3)};

  EXPECT_EQ(model.getDofCount(), 2);
  EXPECT_EQ(model.getActuatorCount(), 3);
  ASSERT_EQ(model.getOffset().size(), 2);
  EXPECT_TRUE(model.getOffset().isZero());
}

TEST(ActuationModelTest, ToWrenchAppliesStructureMatrixAndOffset)
{
  Eigen::MatrixXd As(2, 2);
  As << 1.0, 2.0,
        3.0, 4.0;
  Eigen::VectorXd offset(2);
  offset << 0.5, -0.5;

  const ActuationModel model{As, Eigen::VectorXd::Ones(2),
                             Eigen::VectorXd::Zero(2), offset};

  Eigen::VectorXd forces(2);
  forces << 1.0, 1.0;
  const Eigen::VectorXd w = model.toWrench(forces);

  EXPECT_NEAR(w[0], 3.5, 1e-12);
  EXPECT_NEAR(w[1], 6.5, 1e-12);
}

TEST(ActuationModelTest, ToWrenchRejectsWrongForceSize)
{
  const ActuationModel model{Eigen::MatrixXd::Identity(2, 2),
                             Eigen::VectorXd::Ones(2),
                             Eigen::VectorXd::Zero(2)};

  EXPECT_THROW((void)model.toWrench(Eigen::VectorXd::Ones(3)),
               std::invalid_argument);
}

TEST(ActuationModelTest, RejectsEmptyStructureMatrix)
{
  EXPECT_THROW((ActuationModel{Eigen::MatrixXd(0, 0), Eigen::VectorXd{},
                               Eigen::VectorXd{}}),
               std::invalid_argument);
}

TEST(ActuationModelTest, RejectsBoundSizeMismatch)
{
  EXPECT_THROW((ActuationModel{Eigen::MatrixXd::Identity(2, 2),
                               Eigen::VectorXd::Ones(3),
                               Eigen::VectorXd::Zero(2)}),
               std::invalid_argument);
  EXPECT_THROW((ActuationModel{Eigen::MatrixXd::Identity(2, 2),
                               Eigen::VectorXd::Ones(2),
                               Eigen::VectorXd::Zero(1)}),
               std::invalid_argument);
}

TEST(ActuationModelTest, RejectsOffsetSizeMismatch)
{
  EXPECT_THROW((ActuationModel{Eigen::MatrixXd::Identity(2, 2),
                               Eigen::VectorXd::Ones(2),
                               Eigen::VectorXd::Zero(2),
                               Eigen::VectorXd::Zero(3)}),
               std::invalid_argument);
}

TEST(ActuationModelTest, RejectsLowerBoundAboveUpperBound)
{
  Eigen::VectorXd F_u(2);
  F_u << 1.0, 1.0;
  Eigen::VectorXd F_l(2);
  F_l << 0.0, 2.0;

  EXPECT_THROW((ActuationModel{Eigen::MatrixXd::Identity(2, 2), F_u, F_l}),
               std::invalid_argument);
}

TEST(ActuationModelTest, RejectsNonFiniteValues)
{
  Eigen::MatrixXd As = Eigen::MatrixXd::Identity(2, 2);
  As(0, 1) = std::numeric_limits<double>::quiet_NaN();

  EXPECT_THROW((ActuationModel{As, Eigen::VectorXd::Ones(2),
                               Eigen::VectorXd::Zero(2)}),
               std::invalid_argument);
}

TEST(ActuationModelTest, AcceptsEqualBounds)
{
  EXPECT_NO_THROW((ActuationModel{Eigen::MatrixXd::Identity(2, 2),
                                  Eigen::VectorXd::Ones(2),
                                  Eigen::VectorXd::Ones(2)}));
}

}  // namespace wsa_core
