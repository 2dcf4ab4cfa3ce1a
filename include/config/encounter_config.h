#ifndef ENCGEN_ENCOUNTER_CONFIG_H
#define ENCGEN_ENCOUNTER_CONFIG_H

#include "sim/discrete_sampling_model.h"
#include "sim/encounter_generator.h"
#include "sim/reich_model.h"
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace encgen {

// Descriptor overrides for every model, starting from the standard setup
struct EncounterConfig {
    EncounterConfig();

    reich::ParallelPathsEncounterDescriptor reich;
    discrete::ParallelPathsEncounterDescriptor discrete;
    discrete::RouteEncounterDescriptor route;
    bool has_discrete;  // discrete.* keys were given; otherwise derived from reich

    void applyTo(EncounterGenerator& generator) const;
};

/**
 * Reads "key,value" lines. Keys are "<section>.<field>" with sections
 * reich, discrete and route, e.g. "reich.relative_speed,1.5" or
 * "discrete.sigma_y,0.9". An optional "key,value" header, blank lines and
 * lines starting with '#' are skipped. Unknown keys and malformed lines are
 * logged and skipped; the resulting descriptors must validate.
 */
class ConfigLoader {
public:
    bool loadFile(const std::string& filename, EncounterConfig& config) const;
    bool loadStream(std::istream& in, EncounterConfig& config) const;

    // Returns false for unknown keys or values that do not parse
    bool applySetting(const std::string& key, const std::string& value,
                      EncounterConfig& config) const;

    static std::vector<std::string> getKnownKeys();

private:
    bool applyReichSetting(const std::string& field, double value,
                           reich::ParallelPathsEncounterDescriptor& d) const;
    bool applyDiscreteSetting(const std::string& field, double value,
                              discrete::ParallelPathsEncounterDescriptor& d) const;
    bool applyRouteSetting(const std::string& field, double value,
                           discrete::RouteEncounterDescriptor& d) const;
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    bool validate(EncounterConfig& config) const;

    static std::string trim(const std::string& text);
};

} // namespace encgen

#endif // ENCGEN_ENCOUNTER_CONFIG_H
