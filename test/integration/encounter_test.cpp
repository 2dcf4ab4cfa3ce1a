#include "common/logger.h"
#include "config/encounter_config.h"
#include "core/encounter_monitor.h"
#include "display/encounter_playback.h"
#include "display/encounter_report.h"
#include "sim/encounter_generator.h"
#include <gtest/gtest.h>
#include <sstream>

namespace encgen {
namespace test {

class EncounterIntegrationTest : public testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::WARNING);
    }

    void TearDown() override {
        Logger::getInstance().setLevel(LogLevel::INFO);
    }

    EncounterGenerator generator_;
    MersenneRandomSource random_{20240601};
};

TEST_F(EncounterIntegrationTest, ConfiguredModelsReport) {
    std::istringstream settings("key,value\n"
                                "reich.lateral_separation,3\n"
                                "route.path_length,20\n");
    EncounterConfig config;
    ASSERT_TRUE(ConfigLoader().loadStream(settings, config));
    config.applyTo(generator_);

    EncounterMonitor monitor(0.25);
    for (const auto& model : generator_.getModelNames()) {
        std::vector<Flight> flights = generator_.generate(model, random_);
        ASSERT_EQ(flights.size(), 2u) << model;

        std::ostringstream out;
        EncounterReport(out).write(model, flights, monitor);
        EXPECT_NE(out.str().find("Model: " + model), std::string::npos);

        EncounterSummary summary = monitor.scan(flights);
        EXPECT_GT(summary.samples, 1u);
        EXPECT_GE(summary.min_separation.x, 0);
    }
}

TEST_F(EncounterIntegrationTest, ReichEncountersLoseLateralSeparation) {
    // The overlap time can fall outside the viewing window, so only some
    // encounters show it
    EncounterMonitor monitor(0.01);
    const reich::ParallelPathsEncounterDescriptor& d = generator_.getReichDescriptor();
    int lateral_overlaps = 0;
    for (int trial = 0; trial < 20; ++trial) {
        EncounterSummary summary = monitor.scan(generator_.generate("reich", random_));
        EXPECT_LE(summary.min_separation.y, d.lateral_separation + 1e-9);
        if (summary.min_separation.y < d.aircraft_wingspan) {
            ++lateral_overlaps;
        }
    }
    EXPECT_GT(lateral_overlaps, 0);
}

TEST_F(EncounterIntegrationTest, RouteContainmentNearTarget) {
    double fraction = measureContainment(generator_.getGenerator("routes"), 100, 0.1, random_);
    EXPECT_GT(fraction, 0.9);
}

TEST_F(EncounterIntegrationTest, PlaybackCyclesThroughEncounters) {
    EncounterPlayback playback(generator_.getGenerator("discrete-opposite"), random_);
    const double step = 0.5;
    for (int tick = 0; tick <= 24; ++tick) {
        playback.update(tick * step);
        ASSERT_EQ(playback.getPositions().size(), 2u);
        EXPECT_LT(playback.getEncounterTime(), playback.getEncounterDuration());
    }
    // Discrete encounters last 5 s, so 12 s of playback spans three
    EXPECT_EQ(playback.getEncounterCount(), 3u);
}

} // namespace test
} // namespace encgen
