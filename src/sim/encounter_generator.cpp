#include "sim/encounter_generator.h"
#include "common/logger.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace encgen {

const std::string EncounterGenerator::DEFAULT_MODEL = "reich";

EncounterGenerator::EncounterGenerator()
    : reich_(reich::standardParallelPathsDescriptor())
    , discrete_(discrete::makeParallelPathsDescriptor(reich_))
    , route_(discrete::standardRouteDescriptor())
    , has_discrete_override_(false) {
    initializeModelDefinitions();
}

void EncounterGenerator::initializeModelDefinitions() {
    model_definitions_.clear();

    model_definitions_["reich"] = ModelDefinition{
        [](const EncounterGenerator* g, RandomSource& r) {
            return reich::makeParallelPaths(g->reich_, r);
        },
        "Closed-form Reich model: brief lateral excursion to a sampled overlap position"
    };

    model_definitions_["discrete"] = ModelDefinition{
        [](const EncounterGenerator* g, RandomSource& r) {
            return discrete::makeParallelPaths(g->discrete_, r);
        },
        "Discrete sampling model, same direction, matched to the Reich descriptor"
    };

    model_definitions_["discrete-opposite"] = ModelDefinition{
        [](const EncounterGenerator* g, RandomSource& r) {
            return discrete::makeParallelPathsOppositeDirection(g->discrete_, r);
        },
        "Discrete sampling model with the second flight mirrored to opposite direction"
    };

    model_definitions_["routes"] = ModelDefinition{
        [](const EncounterGenerator* g, RandomSource& r) {
            return discrete::makeRouteFlights(g->route_, r);
        },
        "Discrete sampling over a fixed route length, same direction"
    };

    model_definitions_["routes-opposite"] = ModelDefinition{
        [](const EncounterGenerator* g, RandomSource& r) {
            return discrete::makeRouteFlightsOppositeDirection(g->route_, r);
        },
        "Discrete sampling over a fixed route length, opposite direction"
    };
}

const EncounterGenerator::ModelDefinition&
EncounterGenerator::findModel(const std::string& model) const {
    auto it = model_definitions_.find(model);
    if (it == model_definitions_.end()) {
        throw std::invalid_argument("Unknown encounter model: " + model);
    }
    return it->second;
}

std::vector<Flight> EncounterGenerator::generate(const std::string& model, RandomSource& r) const {
    const ModelDefinition& def = findModel(model);
    try {
        return def.handler(this, r);
    } catch (const std::exception& e) {
        Logger::getInstance().log(LogLevel::ERROR,
            "Encounter generation failed for model " + model + ": " + e.what());
        throw;
    }
}

FlightGenerator EncounterGenerator::getGenerator(const std::string& model) const {
    findModel(model);
    return [this, model](RandomSource& r) {
        return generate(model, r);
    };
}

bool EncounterGenerator::hasModel(const std::string& model) const {
    return model_definitions_.count(model) > 0;
}

std::vector<std::string> EncounterGenerator::getModelNames() const {
    std::vector<std::string> names;
    for (const auto& entry : model_definitions_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string EncounterGenerator::getHelpText() const {
    std::ostringstream oss;
    oss << "Available encounter models:\n";
    for (const auto& entry : model_definitions_) {
        oss << "  " << std::left << std::setw(20) << entry.first
            << entry.second.description << "\n";
    }
    return oss.str();
}

void EncounterGenerator::setReichDescriptor(const reich::ParallelPathsEncounterDescriptor& descriptor) {
    descriptor.validate();
    reich_ = descriptor;
    if (!has_discrete_override_) {
        discrete_ = discrete::makeParallelPathsDescriptor(reich_);
    }
}

void EncounterGenerator::setDiscreteDescriptor(const discrete::ParallelPathsEncounterDescriptor& descriptor) {
    descriptor.validate();
    discrete_ = descriptor;
    has_discrete_override_ = true;
}

void EncounterGenerator::setRouteDescriptor(const discrete::RouteEncounterDescriptor& descriptor) {
    descriptor.validate();
    route_ = descriptor;
}

} // namespace encgen
