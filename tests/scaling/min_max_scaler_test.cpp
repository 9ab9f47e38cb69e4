// tests/scaling/min_max_scaler_test.cpp

#include <gtest/gtest.h>
#include "scaling/min_max_scaler.hpp"

using namespace scaling;

class MinMaxScalerTest : public ::testing::Test {
protected:
    MinMaxScaler<> scaler;
    Eigen::MatrixXd data;

    void SetUp() override {
        data.resize(3, 2);
        data << -2.0, 5.0,
                 0.0, 7.0,
                 2.0, 6.0;
    }
};

TEST_F(MinMaxScalerTest, FittedDataMapsToUnitInterval) {
    const Eigen::MatrixXd scaled = scaler.fitTransform(data);

    EXPECT_NEAR(scaled(0, 0), 0.0, 1e-12);
    EXPECT_NEAR(scaled(1, 0), 0.5, 1e-9);
    EXPECT_NEAR(scaled(2, 0), 1.0, 1e-9);
    EXPECT_NEAR(scaled(0, 1), 0.0, 1e-12);
    EXPECT_NEAR(scaled(1, 1), 1.0, 1e-9);
    EXPECT_NEAR(scaled(2, 1), 0.5, 1e-9);
    EXPECT_GE(scaled.minCoeff(), 0.0);
    EXPECT_LE(scaled.maxCoeff(), 1.0);
}

TEST_F(MinMaxScalerTest, InverseTransformRestoresData) {
    const Eigen::MatrixXd restored = scaler.inverseTransform(scaler.fitTransform(data));
    EXPECT_TRUE(restored.isApprox(data, 1e-10));
}

TEST_F(MinMaxScalerTest, ConstantColumnStaysFinite) {
    Eigen::MatrixXd constant = Eigen::MatrixXd::Constant(4, 2, -1.0);
    const Eigen::MatrixXd scaled = scaler.fitTransform(constant);
    EXPECT_TRUE(scaled.allFinite());
    EXPECT_NEAR(scaled.cwiseAbs().maxCoeff(), 0.0, 1e-12);
}

TEST_F(MinMaxScalerTest, PointsOutsideFittedRangeAreExtrapolated) {
    scaler.fit(data);
    Eigen::MatrixXd outside(1, 2);
    outside << 4.0, 4.0;
    const Eigen::MatrixXd scaled = scaler.transform(outside);
    EXPECT_NEAR(scaled(0, 0), 1.5, 1e-9);
    EXPECT_NEAR(scaled(0, 1), -0.5, 1e-9);
}

TEST_F(MinMaxScalerTest, ExceptionOnInverseTransformBeforeFit) {
    EXPECT_THROW((void) scaler.inverseTransform(data), std::runtime_error);
}
