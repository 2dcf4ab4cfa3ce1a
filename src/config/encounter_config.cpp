#include "config/encounter_config.h"
#include "common/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace encgen {

namespace {

const char COMMENT_CHAR = '#';
const char FIELD_SEPARATOR = ',';

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

std::string sectionOf(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? std::string() : key.substr(0, dot);
}

std::string fieldOf(const std::string& key) {
    auto dot = key.find('.');
    return dot == std::string::npos ? key : key.substr(dot + 1);
}

} // namespace

EncounterConfig::EncounterConfig()
    : reich(reich::standardParallelPathsDescriptor())
    , discrete(discrete::makeParallelPathsDescriptor(reich))
    , route(discrete::standardRouteDescriptor())
    , has_discrete(false) {
}

void EncounterConfig::applyTo(EncounterGenerator& generator) const {
    generator.setReichDescriptor(reich);
    if (has_discrete) {
        generator.setDiscreteDescriptor(discrete);
    }
    generator.setRouteDescriptor(route);
}

std::string ConfigLoader::trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool ConfigLoader::loadFile(const std::string& filename, EncounterConfig& config) const {
    Logger::getInstance().log("Loading encounter configuration from: " + filename);

    std::ifstream file(filename);
    if (!file) {
        Logger::getInstance().log(LogLevel::ERROR, "Failed to open configuration file: " + filename);
        return false;
    }
    return loadStream(file, config);
}

bool ConfigLoader::parseLine(const std::string& line, std::string& key, std::string& value) const {
    std::istringstream iss(line);
    std::string token;
    std::vector<std::string> tokens;

    while (std::getline(iss, token, FIELD_SEPARATOR)) {
        tokens.push_back(trim(token));
    }

    if (tokens.size() != 2 || tokens[0].empty() || tokens[1].empty()) {
        return false;
    }
    key = tokens[0];
    value = tokens[1];
    return true;
}

bool ConfigLoader::loadStream(std::istream& in, EncounterConfig& config) const {
    std::vector<std::pair<std::string, std::string>> settings;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == COMMENT_CHAR) {
            continue;
        }

        std::string key;
        std::string value;
        if (!parseLine(line, key, value)) {
            Logger::getInstance().log(LogLevel::WARNING,
                "Invalid configuration format in line " + std::to_string(line_number) + ": " + line);
            continue;
        }
        if (line_number == 1 && key == "key" && value == "value") {
            continue;  // Header
        }
        settings.emplace_back(key, value);
    }

    // Discrete settings apply on top of the descriptor derived from the final
    // Reich settings, whatever order the file lists them in
    bool has_discrete_settings = false;
    for (const auto& setting : settings) {
        if (sectionOf(setting.first) == "discrete") {
            has_discrete_settings = true;
            continue;
        }
        if (!applySetting(setting.first, setting.second, config)) {
            Logger::getInstance().log(LogLevel::WARNING,
                "Ignoring configuration setting: " + setting.first + "," + setting.second);
        }
    }

    if (has_discrete_settings) {
        try {
            config.discrete = discrete::makeParallelPathsDescriptor(config.reich);
        } catch (const std::exception& e) {
            Logger::getInstance().log(LogLevel::ERROR,
                "Cannot derive discrete descriptor: " + std::string(e.what()));
            return false;
        }
        for (const auto& setting : settings) {
            if (sectionOf(setting.first) != "discrete") {
                continue;
            }
            if (!applySetting(setting.first, setting.second, config)) {
                Logger::getInstance().log(LogLevel::WARNING,
                    "Ignoring configuration setting: " + setting.first + "," + setting.second);
            }
        }
    }

    if (!validate(config)) {
        return false;
    }

    Logger::getInstance().log("Applied " + std::to_string(settings.size()) +
                              " configuration settings");
    return true;
}

bool ConfigLoader::validate(EncounterConfig& config) const {
    try {
        config.reich.validate();
        if (config.has_discrete) {
            config.discrete.validate();
        } else {
            config.discrete = discrete::makeParallelPathsDescriptor(config.reich);
        }
        config.route.validate();
        return true;
    } catch (const std::exception& e) {
        Logger::getInstance().log(LogLevel::ERROR,
            "Invalid encounter configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::applySetting(const std::string& key, const std::string& value,
                                EncounterConfig& config) const {
    double number = 0.0;
    if (!parseDouble(value, number)) {
        return false;
    }

    const std::string section = sectionOf(key);
    const std::string field = fieldOf(key);

    if (section == "reich") {
        return applyReichSetting(field, number, config.reich);
    }
    if (section == "discrete") {
        if (!applyDiscreteSetting(field, number, config.discrete)) {
            return false;
        }
        config.has_discrete = true;
        return true;
    }
    if (section == "route") {
        return applyRouteSetting(field, number, config.route);
    }
    return false;
}

bool ConfigLoader::applyReichSetting(const std::string& field, double value,
                                     reich::ParallelPathsEncounterDescriptor& d) const {
    if (field == "lateral_separation")           d.lateral_separation = value;
    else if (field == "aircraft_length")         d.aircraft_length = value;
    else if (field == "aircraft_wingspan")       d.aircraft_wingspan = value;
    else if (field == "aircraft_height")         d.aircraft_height = value;
    else if (field == "op_half_width")           d.op_half_width = value;
    else if (field == "op_half_height")          d.op_half_height = value;
    else if (field == "flight_duration")         d.flight_duration = value;
    else if (field == "nominal_speed")           d.nominal_speed = value;
    else if (field == "relative_speed")          d.relative_speed = value;
    else if (field == "relative_lateral_speed")  d.relative_lateral_speed = value;
    else if (field == "relative_vertical_speed") d.relative_vertical_speed = value;
    else return false;
    return true;
}

bool ConfigLoader::applyDiscreteSetting(const std::string& field, double value,
                                        discrete::ParallelPathsEncounterDescriptor& d) const {
    if (field == "time_length")              d.time_length = value;
    else if (field == "v1_ground")           d.v1_ground = value;
    else if (field == "v2_ground")           d.v2_ground = value;
    else if (field == "lateral_separation")  d.lateral_separation = value;
    else if (field == "aircraft_size_x")     d.aircraft_size.x = value;
    else if (field == "aircraft_size_y")     d.aircraft_size.y = value;
    else if (field == "aircraft_size_z")     d.aircraft_size.z = value;
    else if (field == "sampling_frequency")  d.sampling_frequency = value;
    else if (field == "sigma_x")             d.sigma.x = value;
    else if (field == "sigma_y")             d.sigma.y = value;
    else if (field == "sigma_z")             d.sigma.z = value;
    else return false;
    return true;
}

bool ConfigLoader::applyRouteSetting(const std::string& field, double value,
                                     discrete::RouteEncounterDescriptor& d) const {
    if (field == "path_length")               d.path_length = value;
    else if (field == "ground_speed_1")       d.ground_speed_1 = value;
    else if (field == "ground_speed_2")       d.ground_speed_2 = value;
    else if (field == "lateral_separation")   d.lateral_separation = value;
    else if (field == "aircraft_size_x")      d.aircraft_size.x = value;
    else if (field == "aircraft_size_y")      d.aircraft_size.y = value;
    else if (field == "aircraft_size_z")      d.aircraft_size.z = value;
    else if (field == "op_intent_width")      d.op_intent_width = value;
    else if (field == "op_intent_height")     d.op_intent_height = value;
    else if (field == "p_containment")        d.p_containment = value;
    else if (field == "lateral_exit_speed")   d.lateral_exit_speed = value;
    else if (field == "vertical_exit_speed")  d.vertical_exit_speed = value;
    else return false;
    return true;
}

std::vector<std::string> ConfigLoader::getKnownKeys() {
    return {
        "reich.lateral_separation", "reich.aircraft_length", "reich.aircraft_wingspan",
        "reich.aircraft_height", "reich.op_half_width", "reich.op_half_height",
        "reich.flight_duration", "reich.nominal_speed", "reich.relative_speed",
        "reich.relative_lateral_speed", "reich.relative_vertical_speed",
        "discrete.time_length", "discrete.v1_ground", "discrete.v2_ground",
        "discrete.lateral_separation", "discrete.aircraft_size_x", "discrete.aircraft_size_y",
        "discrete.aircraft_size_z", "discrete.sampling_frequency", "discrete.sigma_x",
        "discrete.sigma_y", "discrete.sigma_z",
        "route.path_length", "route.ground_speed_1", "route.ground_speed_2",
        "route.lateral_separation", "route.aircraft_size_x", "route.aircraft_size_y",
        "route.aircraft_size_z", "route.op_intent_width", "route.op_intent_height",
        "route.p_containment", "route.lateral_exit_speed", "route.vertical_exit_speed"
    };
}

} // namespace encgen
