#include "core/conformance.h"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

namespace encgen {
namespace test {

TEST(ClassifyAxisTest, Contained) {
    EXPECT_EQ(classifyAxis(1, 2, 0, 3), AxisConformance::CONTAINED);
    // Touching both bounds is still contained
    EXPECT_EQ(classifyAxis(0, 3, 0, 3), AxisConformance::CONTAINED);
}

TEST(ClassifyAxisTest, Straddling) {
    EXPECT_EQ(classifyAxis(-1, 1, 0, 3), AxisConformance::STRADDLING_LOWER);
    EXPECT_EQ(classifyAxis(2, 4, 0, 3), AxisConformance::STRADDLING_UPPER);
}

TEST(ClassifyAxisTest, BoxWiderThanBoundStraddlesLower) {
    // Both boundaries fall inside the box; lower is checked first
    EXPECT_EQ(classifyAxis(-1, 4, 0, 3), AxisConformance::STRADDLING_LOWER);
}

TEST(ClassifyAxisTest, Outside) {
    EXPECT_EQ(classifyAxis(-3, -1, 0, 3), AxisConformance::BELOW);
    EXPECT_EQ(classifyAxis(4, 5, 0, 3), AxisConformance::ABOVE);
}

TEST(ClassifyAxisTest, NaNCannotBeClassified) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(classifyAxis(nan, nan, 0, 3), std::invalid_argument);
}

class ConformanceTest : public testing::Test {
protected:
    // Moves from y = 0 to y = 10 over 10 s inside a lateral bound of [-3, 3]
    Flight makeFlight() const {
        return Flight(FlightPath({{0, 0, 0, 0}, {10, 0, 10, 0}}),
                      OperationalIntent{{-5, -3, -3}, {5, 3, 3}},
                      Vector3{2, 2, 2});
    }
};

TEST_F(ConformanceTest, ConformingAtStart) {
    ConformanceReport report = evaluateConformance(makeFlight(), 0);
    EXPECT_EQ(report.level, ConformanceLevel::CONFORMING);
    EXPECT_TRUE(report.isConforming());
    EXPECT_EQ(report.axis(Axis::Y).status, AxisConformance::CONTAINED);
    EXPECT_DOUBLE_EQ(report.axis(Axis::Y).margin, 2.0);
}

TEST_F(ConformanceTest, StraddlingWhileCrossingBoundary) {
    ConformanceReport report = evaluateConformance(makeFlight(), 3);
    EXPECT_EQ(report.level, ConformanceLevel::STRADDLING);
    EXPECT_EQ(report.axis(Axis::Y).status, AxisConformance::STRADDLING_UPPER);
    EXPECT_EQ(report.axis(Axis::X).status, AxisConformance::CONTAINED);
    EXPECT_DOUBLE_EQ(report.axis(Axis::Y).margin, -1.0);
}

TEST_F(ConformanceTest, NonConformingOnceOutside) {
    ConformanceReport report = evaluateConformance(makeFlight(), 8);
    EXPECT_EQ(report.level, ConformanceLevel::NON_CONFORMING);
    EXPECT_EQ(report.axis(Axis::Y).status, AxisConformance::ABOVE);
    EXPECT_FALSE(report.isConforming());
}

TEST(ConformanceStringTest, Names) {
    EXPECT_EQ(getAxisConformanceString(AxisConformance::STRADDLING_LOWER), "STRADDLING_LOWER");
    EXPECT_EQ(getAxisConformanceString(AxisConformance::BELOW), "BELOW");
    EXPECT_EQ(getConformanceLevelString(ConformanceLevel::NON_CONFORMING), "NON_CONFORMING");
    EXPECT_EQ(getConformanceLevelString(ConformanceLevel::CONFORMING), "CONFORMING");
}

} // namespace test
} // namespace encgen
