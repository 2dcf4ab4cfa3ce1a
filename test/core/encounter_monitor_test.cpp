#include "core/encounter_monitor.h"
#include "mock_random_source.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace encgen {
namespace test {

class EncounterMonitorTest : public testing::Test {
protected:
    // Two unit aircraft flying towards each other along x, 1 apart in y
    std::vector<Flight> makeHeadOn() const {
        OperationalIntent intent{{-10, -2, -1}, {10, 2, 1}};
        return {
            Flight(FlightPath({{0, -5, -0.5, 0}, {10, 5, -0.5, 0}}), intent, Vector3{1, 1, 1}),
            Flight(FlightPath({{0, 5, 0.5, 0}, {10, -5, 0.5, 0}}), intent, Vector3{1, 1, 1})
        };
    }
};

TEST_F(EncounterMonitorTest, RejectsBadStep) {
    EXPECT_THROW(EncounterMonitor(0), std::invalid_argument);
    EXPECT_THROW(EncounterMonitor(-1), std::invalid_argument);
}

TEST_F(EncounterMonitorTest, SampleTimesIncludeEnd) {
    EncounterMonitor monitor(3);
    std::vector<double> times = monitor.sampleTimes(makeHeadOn());
    ASSERT_EQ(times.size(), 5u);
    EXPECT_DOUBLE_EQ(times[0], 0);
    EXPECT_DOUBLE_EQ(times[3], 9);
    EXPECT_DOUBLE_EQ(times[4], 10);
}

TEST_F(EncounterMonitorTest, SampleTimesNotDuplicatedWhenStepDivides) {
    EncounterMonitor monitor(2.5);
    std::vector<double> times = monitor.sampleTimes(makeHeadOn());
    ASSERT_EQ(times.size(), 5u);
    EXPECT_DOUBLE_EQ(times.back(), 10);
}

TEST_F(EncounterMonitorTest, SampleReportsSeparationAndOverlap) {
    EncounterMonitor monitor(1);
    std::vector<Flight> flights = makeHeadOn();

    EncounterSample early = monitor.sample(flights, 0);
    ASSERT_EQ(early.pairs.size(), 1u);
    EXPECT_DOUBLE_EQ(early.pairs[0].separation.x, 10);
    EXPECT_FALSE(early.pairs[0].overlap);

    // Boxes reach 1 on each axis; y separation is exactly 1 so no overlap
    EncounterSample crossing = monitor.sample(flights, 5);
    EXPECT_DOUBLE_EQ(crossing.pairs[0].separation.x, 0);
    EXPECT_DOUBLE_EQ(crossing.pairs[0].separation.y, 1);
    EXPECT_FALSE(crossing.pairs[0].overlap);
}

TEST_F(EncounterMonitorTest, DetectsOverlap) {
    OperationalIntent intent{{-10, -2, -1}, {10, 2, 1}};
    std::vector<Flight> flights{
        Flight(FlightPath({{0, -5, 0, 0}, {10, 5, 0, 0}}), intent, Vector3{1, 1, 1}),
        Flight(FlightPath({{0, 5, 0.2, 0}, {10, -5, 0.2, 0}}), intent, Vector3{1, 1, 1})
    };

    EncounterMonitor monitor(1);
    EXPECT_TRUE(monitor.sample(flights, 5).pairs[0].overlap);

    EncounterSummary summary = monitor.scan(flights);
    EXPECT_GT(summary.overlap_duration, 0);
    EXPECT_NEAR(summary.min_separation.y, 0.2, 1e-12);
}

TEST_F(EncounterMonitorTest, ScanSummarisesContainment) {
    EncounterMonitor monitor(1);
    EncounterSummary summary = monitor.scan(makeHeadOn());

    EXPECT_EQ(summary.samples, 11u);
    EXPECT_DOUBLE_EQ(summary.t_end, 10);
    ASSERT_EQ(summary.containment_fraction.size(), 2u);
    EXPECT_DOUBLE_EQ(summary.containment_fraction[0], 1.0);
    EXPECT_DOUBLE_EQ(summary.conforming_fraction[1], 1.0);
    EXPECT_DOUBLE_EQ(summary.overlap_duration, 0);
}

TEST_F(EncounterMonitorTest, ScanOfNoFlights) {
    EncounterMonitor monitor(1);
    EncounterSummary summary = monitor.scan({});
    EXPECT_EQ(summary.samples, 0u);
    EXPECT_TRUE(summary.containment_fraction.empty());
}

TEST_F(EncounterMonitorTest, IsContainedIncludesBoundary) {
    OperationalIntent intent{{0, 0, 0}, {1, 1, 1}};
    EXPECT_TRUE(EncounterMonitor::isContained(Vector3{1, 0, 0.5}, intent));
    EXPECT_FALSE(EncounterMonitor::isContained(Vector3{1.01, 0, 0.5}, intent));
}

TEST_F(EncounterMonitorTest, MeasureContainmentPoolsTrials) {
    MockRandomSource random;
    int calls = 0;
    FlightGenerator generator = [this, &calls](RandomSource&) {
        ++calls;
        return makeHeadOn();
    };

    EXPECT_DOUBLE_EQ(measureContainment(generator, 3, 1, random), 1.0);
    EXPECT_EQ(calls, 3);
}

TEST_F(EncounterMonitorTest, MeasureContainmentNeedsTrials) {
    MockRandomSource random;
    FlightGenerator generator = [this](RandomSource&) { return makeHeadOn(); };
    EXPECT_THROW(measureContainment(generator, 0, 1, random), std::invalid_argument);
}

} // namespace test
} // namespace encgen
