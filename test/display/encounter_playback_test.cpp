#include "display/encounter_playback.h"
#include "mock_random_source.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace encgen {
namespace test {

class EncounterPlaybackTest : public testing::Test {
protected:
    void SetUp() override {
        generated_ = 0;
        make_flights_ = [this](RandomSource&) {
            ++generated_;
            OperationalIntent intent{{-10, -1, -1}, {10, 1, 1}};
            return std::vector<Flight>{
                Flight(FlightPath({{0, 0, 0, 0}, {4, 8, 0, 0}}), intent, Vector3{1, 1, 1}),
                Flight(FlightPath({{0, 0, 0, 0}, {2, -2, 0, 0}}), intent, Vector3{1, 1, 1})
            };
        };
    }

    MockRandomSource random_;
    FlightGenerator make_flights_;
    int generated_;
};

TEST_F(EncounterPlaybackTest, FirstUpdateGenerates) {
    EncounterPlayback playback(make_flights_, random_);
    EXPECT_FALSE(playback.hasEncounter());

    EXPECT_TRUE(playback.update(100));
    EXPECT_EQ(playback.getEncounterCount(), 1u);
    EXPECT_DOUBLE_EQ(playback.getEncounterDuration(), 4);
    EXPECT_DOUBLE_EQ(playback.getEncounterTime(), 0);
    ASSERT_EQ(playback.getPositions().size(), 2u);
    EXPECT_EQ(playback.getPositions()[0], (Vector3{0, 0, 0}));
}

TEST_F(EncounterPlaybackTest, MovesAircraftRelativeToEncounterStart) {
    EncounterPlayback playback(make_flights_, random_);
    playback.update(100);

    EXPECT_FALSE(playback.update(101));
    EXPECT_DOUBLE_EQ(playback.getEncounterTime(), 1);
    EXPECT_EQ(playback.getPositions()[0], (Vector3{2, 0, 0}));
    EXPECT_EQ(playback.getPositions()[1], (Vector3{-1, 0, 0}));

    // Second flight holds its end position once its own path is done
    EXPECT_FALSE(playback.update(103));
    EXPECT_EQ(playback.getPositions()[1], (Vector3{-2, 0, 0}));
}

TEST_F(EncounterPlaybackTest, RegeneratesAfterLongestFlight) {
    EncounterPlayback playback(make_flights_, random_);
    playback.update(0);
    EXPECT_FALSE(playback.update(3.9));
    EXPECT_EQ(generated_, 1);

    EXPECT_TRUE(playback.update(4));
    EXPECT_EQ(generated_, 2);
    EXPECT_EQ(playback.getEncounterCount(), 2u);
    EXPECT_DOUBLE_EQ(playback.getEncounterTime(), 0);

    EXPECT_FALSE(playback.update(5));
    EXPECT_DOUBLE_EQ(playback.getEncounterTime(), 1);
}

TEST_F(EncounterPlaybackTest, RequiresGenerator) {
    EXPECT_THROW(EncounterPlayback(FlightGenerator(), random_), std::invalid_argument);
}

TEST_F(EncounterPlaybackTest, EmptyEncounterIsAnError) {
    EncounterPlayback playback([](RandomSource&) { return std::vector<Flight>(); }, random_);
    EXPECT_THROW(playback.update(0), std::runtime_error);
}

} // namespace test
} // namespace encgen
