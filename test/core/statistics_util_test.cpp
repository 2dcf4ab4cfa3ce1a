#include "core/statistics_util.h"
#include "common/constants.h"
#include "common/errors.h"
#include <gtest/gtest.h>
#include <cmath>

namespace encgen {
namespace test {

TEST(StatisticsUtilTest, ProbitKnownValues) {
    EXPECT_NEAR(stats::probit(0.5), 0.0, 1e-12);
    EXPECT_NEAR(stats::probit(0.975), 1.959963985, 1e-8);
    EXPECT_NEAR(stats::probit(0.025), -1.959963985, 1e-8);
}

TEST(StatisticsUtilTest, ProbitAtEndpointsIsInfinite) {
    EXPECT_TRUE(std::isinf(stats::probit(1.0)));
    EXPECT_GT(stats::probit(1.0), 0);
    EXPECT_TRUE(std::isinf(stats::probit(0.0)));
    EXPECT_LT(stats::probit(0.0), 0);
}

TEST(StatisticsUtilTest, SigmaForNinetyFivePercent) {
    // 95% of a normal distribution lies within 1.96 sigma of the mean
    EXPECT_NEAR(stats::computeSigma(2 * 1.959963985, 0.95), 1.0, 1e-8);
    EXPECT_NEAR(stats::computeVolumeSize(1.0, 0.95), 2 * 1.959963985, 1e-8);
}

TEST(StatisticsUtilTest, SigmaAndVolumeSizeAreInverses) {
    for (double p : {0.5, 0.8, 0.9, 0.95, 0.99}) {
        for (double size : {0.1, 1.0, 14.0, 250.0}) {
            double sigma = stats::computeSigma(size, p);
            EXPECT_NEAR(stats::computeVolumeSize(sigma, p), size, 1e-9 * size);
        }
    }
}

TEST(StatisticsUtilTest, CertainContainmentIsDegenerate) {
    EXPECT_DOUBLE_EQ(stats::computeSigma(10.0, 1.0), 0.0);
    EXPECT_TRUE(std::isinf(stats::computeVolumeSize(1.0, 1.0)));
}

TEST(StatisticsUtilTest, CaffeinationAtTablePoints) {
    for (const auto& entry : constants::CAFFEINATION_TABLE) {
        EXPECT_NEAR(stats::inferCaffeination(entry.first, 1.0, 1.0), entry.second, 1e-12);
    }
}

TEST(StatisticsUtilTest, CaffeinationInterpolatesAndScales) {
    // Midway between the 0.8 and 0.9 entries
    EXPECT_NEAR(stats::inferCaffeination(0.85, 1.0, 1.0), (0.633 + 0.579) / 2, 1e-12);
    // Proportional to bound size, inversely to exit speed
    EXPECT_NEAR(stats::inferCaffeination(0.95, 2.0, 14.0), 0.554 * 7.0, 1e-12);
}

TEST(StatisticsUtilTest, CaffeinationHoldsOutsideTable) {
    EXPECT_NEAR(stats::inferCaffeination(0.5, 1.0, 1.0), 0.633, 1e-12);
    EXPECT_NEAR(stats::inferCaffeination(0.9999, 1.0, 1.0), 0.52, 1e-12);
}

TEST(StatisticsUtilTest, ContainmentFractionValidation) {
    EXPECT_NO_THROW(stats::requireContainmentFraction(0.95, "p"));
    EXPECT_THROW(stats::requireContainmentFraction(0.0, "p"), NumericDomainError);
    EXPECT_THROW(stats::requireContainmentFraction(1.0, "p"), NumericDomainError);
    EXPECT_THROW(stats::requireContainmentFraction(std::nan(""), "p"), NumericDomainError);
}

} // namespace test
} // namespace encgen
