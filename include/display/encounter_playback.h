#ifndef ENCGEN_ENCOUNTER_PLAYBACK_H
#define ENCGEN_ENCOUNTER_PLAYBACK_H

#include "common/random_source.h"
#include "common/types.h"
#include "core/flight.h"
#include <vector>

namespace encgen {

/**
 * Plays generated encounters back against an external clock.
 *
 * Each update() places every aircraft at its location for the time elapsed
 * since the current encounter started. Once that time reaches the longest
 * flight's t_max the encounter is complete and the next update() starts a
 * fresh one from the generator.
 */
class EncounterPlayback {
public:
    EncounterPlayback(FlightGenerator make_flights, RandomSource& r);

    // `now` is in seconds on any monotonic clock. Returns true when a new
    // encounter was generated by this call.
    bool update(double now);

    bool hasEncounter() const { return !flights_.empty(); }
    const std::vector<Flight>& getFlights() const { return flights_; }
    const std::vector<Vector3>& getPositions() const { return positions_; }

    // Time within the current encounter as of the last update
    double getEncounterTime() const { return encounter_time_; }
    double getEncounterDuration() const { return duration_; }
    size_t getEncounterCount() const { return encounter_count_; }

private:
    void startEncounter(double now);
    void moveAircraft();

    FlightGenerator make_flights_;
    RandomSource& random_;

    std::vector<Flight> flights_;
    std::vector<Vector3> positions_;
    double start_;
    double duration_;
    double encounter_time_;
    size_t encounter_count_;
};

} // namespace encgen

#endif // ENCGEN_ENCOUNTER_PLAYBACK_H
