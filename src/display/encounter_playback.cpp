#include "display/encounter_playback.h"
#include "common/logger.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace encgen {

EncounterPlayback::EncounterPlayback(FlightGenerator make_flights, RandomSource& r)
    : make_flights_(std::move(make_flights))
    , random_(r)
    , start_(0.0)
    , duration_(0.0)
    , encounter_time_(0.0)
    , encounter_count_(0) {
    if (!make_flights_) {
        throw std::invalid_argument("Playback needs a flight generator");
    }
}

bool EncounterPlayback::update(double now) {
    bool generated = false;

    if (hasEncounter() && now - start_ >= duration_) {
        Logger::getInstance().log(LogLevel::DEBUG,
            "Encounter " + std::to_string(encounter_count_) + " complete");
        flights_.clear();
        positions_.clear();
    }

    if (!hasEncounter()) {
        startEncounter(now);
        generated = true;
    }

    encounter_time_ = now - start_;
    moveAircraft();
    return generated;
}

void EncounterPlayback::startEncounter(double now) {
    flights_ = make_flights_(random_);
    if (flights_.empty()) {
        throw std::runtime_error("Flight generator produced no flights");
    }

    duration_ = 0.0;
    for (const auto& flight : flights_) {
        duration_ = std::max(duration_, flight.path.tMax());
    }
    start_ = now;
    ++encounter_count_;

    Logger::getInstance().log("Generating new encounter (" +
                              std::to_string(encounter_count_) + ")");
}

void EncounterPlayback::moveAircraft() {
    positions_.clear();
    for (const auto& flight : flights_) {
        positions_.push_back(flight.locationAt(encounter_time_));
    }
}

} // namespace encgen
