#ifndef ENCGEN_ENCOUNTER_GENERATOR_H
#define ENCGEN_ENCOUNTER_GENERATOR_H

#include "common/random_source.h"
#include "core/flight.h"
#include "sim/discrete_sampling_model.h"
#include "sim/reich_model.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace encgen {

// Named encounter models, each bound to its current descriptor
class EncounterGenerator {
public:
    EncounterGenerator();
    ~EncounterGenerator() = default;

    std::vector<Flight> generate(const std::string& model, RandomSource& r) const;

    // Generator bound to this instance; throws std::invalid_argument for unknown
    // models. It reads the descriptors current at each call, so this
    // EncounterGenerator must outlive every copy of the returned generator.
    FlightGenerator getGenerator(const std::string& model) const;

    bool hasModel(const std::string& model) const;
    std::vector<std::string> getModelNames() const;
    std::string getHelpText() const;

    // Replacing the Reich descriptor also re-derives the discrete descriptor
    // unless one was set explicitly
    void setReichDescriptor(const reich::ParallelPathsEncounterDescriptor& descriptor);
    void setDiscreteDescriptor(const discrete::ParallelPathsEncounterDescriptor& descriptor);
    void setRouteDescriptor(const discrete::RouteEncounterDescriptor& descriptor);

    const reich::ParallelPathsEncounterDescriptor& getReichDescriptor() const { return reich_; }
    const discrete::ParallelPathsEncounterDescriptor& getDiscreteDescriptor() const { return discrete_; }
    const discrete::RouteEncounterDescriptor& getRouteDescriptor() const { return route_; }

    static const std::string DEFAULT_MODEL;

private:
    struct ModelDefinition {
        std::function<std::vector<Flight>(const EncounterGenerator*, RandomSource&)> handler;
        std::string description;
    };

    void initializeModelDefinitions();
    const ModelDefinition& findModel(const std::string& model) const;

    std::map<std::string, ModelDefinition> model_definitions_;
    reich::ParallelPathsEncounterDescriptor reich_;
    discrete::ParallelPathsEncounterDescriptor discrete_;
    discrete::RouteEncounterDescriptor route_;
    bool has_discrete_override_;
};

} // namespace encgen

#endif // ENCGEN_ENCOUNTER_GENERATOR_H
