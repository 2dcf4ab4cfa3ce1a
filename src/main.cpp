#include "common/errors.h"
#include "common/logger.h"
#include "common/random_source.h"
#include "config/encounter_config.h"
#include "core/encounter_monitor.h"
#include "display/encounter_playback.h"
#include "display/encounter_report.h"
#include "sim/encounter_generator.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    std::string model = encgen::EncounterGenerator::DEFAULT_MODEL;
    bool has_seed = false;
    uint64_t seed = 0;
    double step = 0.5;
    int trials = 0;
    double play_seconds = 0.0;
    std::string config_file;
    std::string log_file;
    bool verbose = false;
    bool color = false;
    bool list_models = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [model] [--seed N] [--step S] [--trials N] [--config FILE]"
              << " [--log FILE] [--verbose] [--color] [--play SECONDS] [--list]" << std::endl;
}

std::string requireValue(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

Options parseArguments(int argc, char** argv) {
    Options options;
    bool have_model = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed") {
            options.seed = std::stoull(requireValue(argc, argv, i));
            options.has_seed = true;
        } else if (arg == "--step") {
            options.step = std::stod(requireValue(argc, argv, i));
        } else if (arg == "--trials") {
            options.trials = std::stoi(requireValue(argc, argv, i));
            if (options.trials <= 0) {
                throw std::invalid_argument("--trials must be positive");
            }
        } else if (arg == "--play") {
            options.play_seconds = std::stod(requireValue(argc, argv, i));
            if (!(options.play_seconds > 0)) {
                throw std::invalid_argument("--play must be positive");
            }
        } else if (arg == "--config") {
            options.config_file = requireValue(argc, argv, i);
        } else if (arg == "--log") {
            options.log_file = requireValue(argc, argv, i);
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--color") {
            options.color = true;
        } else if (arg == "--list") {
            options.list_models = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (!have_model) {
            options.model = arg;
            have_model = true;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    return options;
}

void runPlayback(const encgen::EncounterGenerator& generator, const Options& options,
                 encgen::RandomSource& random, encgen::EncounterReport& report) {
    encgen::EncounterPlayback playback(generator.getGenerator(options.model), random);

    for (size_t tick = 0; tick * options.step <= options.play_seconds; ++tick) {
        playback.update(tick * options.step);
        report.writeFrame(playback.getEncounterCount(), playback.getEncounterTime(),
                          playback.getFlights());
    }
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    encgen::Logger& logger = encgen::Logger::getInstance();
    logger.setLevel(options.verbose ? encgen::LogLevel::DEBUG : encgen::LogLevel::WARNING);
    if (!options.log_file.empty() && !logger.setLogFile(options.log_file)) {
        std::cerr << "Failed to open log file: " << options.log_file << std::endl;
        return 1;
    }

    try {
        encgen::EncounterGenerator generator;

        if (options.list_models) {
            std::cout << generator.getHelpText();
            return 0;
        }

        if (!generator.hasModel(options.model)) {
            std::cerr << "Unknown model: " << options.model << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (!options.config_file.empty()) {
            encgen::EncounterConfig config;
            encgen::ConfigLoader loader;
            if (!loader.loadFile(options.config_file, config)) {
                std::cerr << "Failed to load configuration: " << options.config_file << std::endl;
                return 1;
            }
            config.applyTo(generator);
        }

        // Unseeded runs share the process-wide source
        std::unique_ptr<encgen::MersenneRandomSource> seeded;
        encgen::RandomSource* random = &encgen::defaultRandomSource();
        if (options.has_seed) {
            seeded = std::make_unique<encgen::MersenneRandomSource>(options.seed);
            random = seeded.get();
            logger.log("Using seed " + std::to_string(options.seed));
        }

        encgen::EncounterMonitor monitor(options.step);
        encgen::EncounterReport report(std::cout, options.color);

        if (options.play_seconds > 0) {
            runPlayback(generator, options, *random, report);
            return 0;
        }

        report.write(options.model, generator.generate(options.model, *random), monitor);

        if (options.trials > 0) {
            double fraction = encgen::measureContainment(
                generator.getGenerator(options.model), options.trials, options.step, *random);
            report.writeContainment(options.model, options.trials, fraction);
        }

        return 0;

    } catch (const encgen::UnsupportedConfiguration& e) {
        std::cerr << "Unsupported configuration: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }
}
