#include "sim/encounter_generator.h"
#include "common/errors.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

namespace encgen {
namespace test {

class EncounterGeneratorTest : public testing::Test {
protected:
    EncounterGenerator generator_;
    MersenneRandomSource random_{8};
};

TEST_F(EncounterGeneratorTest, RegisteredModels) {
    std::vector<std::string> names = generator_.getModelNames();
    EXPECT_EQ(names.size(), 5u);
    for (const char* name : {"reich", "discrete", "discrete-opposite", "routes", "routes-opposite"}) {
        EXPECT_TRUE(generator_.hasModel(name)) << name;
        EXPECT_NE(std::find(names.begin(), names.end(), name), names.end());
    }
    EXPECT_TRUE(generator_.hasModel(EncounterGenerator::DEFAULT_MODEL));
    EXPECT_FALSE(generator_.hasModel("helix"));
}

TEST_F(EncounterGeneratorTest, EveryModelGeneratesTwoFlights) {
    for (const auto& name : generator_.getModelNames()) {
        std::vector<Flight> flights = generator_.generate(name, random_);
        EXPECT_EQ(flights.size(), 2u) << name;
    }
}

TEST_F(EncounterGeneratorTest, UnknownModelRejected) {
    EXPECT_THROW(generator_.generate("helix", random_), std::invalid_argument);
    EXPECT_THROW(generator_.getGenerator("helix"), std::invalid_argument);
}

TEST_F(EncounterGeneratorTest, BoundGeneratorUsesCurrentDescriptor) {
    FlightGenerator make_flights = generator_.getGenerator("discrete");

    discrete::ParallelPathsEncounterDescriptor d = generator_.getDiscreteDescriptor();
    d.time_length = 2;
    generator_.setDiscreteDescriptor(d);

    std::vector<Flight> flights = make_flights(random_);
    EXPECT_EQ(flights[0].path.tMax(), 2.0);
}

TEST_F(EncounterGeneratorTest, ReichDescriptorRederivesDiscrete) {
    reich::ParallelPathsEncounterDescriptor r = generator_.getReichDescriptor();
    r.lateral_separation *= 2;
    generator_.setReichDescriptor(r);
    EXPECT_DOUBLE_EQ(generator_.getDiscreteDescriptor().lateral_separation, r.lateral_separation);
}

TEST_F(EncounterGeneratorTest, ExplicitDiscreteDescriptorKept) {
    discrete::ParallelPathsEncounterDescriptor d = generator_.getDiscreteDescriptor();
    d.lateral_separation = 1.5;
    generator_.setDiscreteDescriptor(d);

    reich::ParallelPathsEncounterDescriptor r = generator_.getReichDescriptor();
    r.lateral_separation = 9;
    generator_.setReichDescriptor(r);
    EXPECT_DOUBLE_EQ(generator_.getDiscreteDescriptor().lateral_separation, 1.5);
}

TEST_F(EncounterGeneratorTest, InvalidDescriptorsRejected) {
    reich::ParallelPathsEncounterDescriptor r = generator_.getReichDescriptor();
    r.op_half_width = -1;
    EXPECT_THROW(generator_.setReichDescriptor(r), std::invalid_argument);

    discrete::RouteEncounterDescriptor route = generator_.getRouteDescriptor();
    route.p_containment = 0;
    EXPECT_THROW(generator_.setRouteDescriptor(route), NumericDomainError);
}

TEST_F(EncounterGeneratorTest, FormationFlightPropagates) {
    reich::ParallelPathsEncounterDescriptor r = generator_.getReichDescriptor();
    r.relative_speed = 0;
    generator_.setReichDescriptor(r);
    EXPECT_THROW(generator_.generate("reich", random_), UnsupportedConfiguration);
}

TEST_F(EncounterGeneratorTest, HelpTextListsModels) {
    std::string help = generator_.getHelpText();
    for (const auto& name : generator_.getModelNames()) {
        EXPECT_NE(help.find(name), std::string::npos);
    }
}

} // namespace test
} // namespace encgen
