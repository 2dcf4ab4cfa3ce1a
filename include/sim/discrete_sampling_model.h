#ifndef ENCGEN_DISCRETE_SAMPLING_MODEL_H
#define ENCGEN_DISCRETE_SAMPLING_MODEL_H

#include "common/random_source.h"
#include "common/types.h"
#include "core/flight.h"
#include "core/flight_path.h"
#include "sim/reich_model.h"
#include <vector>

namespace encgen {
namespace discrete {

struct ParallelPathsEncounterDescriptor {
    double time_length;          // Duration of the encounter
    double v1_ground;            // Longitudinal ground velocity (directional) of the first flight
    double v2_ground;            // Longitudinal ground velocity (directional) of the second flight
    double lateral_separation;   // Nominal lateral separation between the flights
    Vector3 aircraft_size;       // Size of aircraft collision volume
    double sampling_frequency;   // Frequency at which new deviation samples are drawn
    Vector3 sigma;               // Standard deviation of each new deviation sample, per axis

    void validate() const;
};

// Physical setup matched as closely as practical to a Reich descriptor
ParallelPathsEncounterDescriptor makeParallelPathsDescriptor(
    const reich::ParallelPathsEncounterDescriptor& reich);

// Matched to the standard Reich descriptor
ParallelPathsEncounterDescriptor makeParallelPathsDescriptor();

// Standalone route encounter, bounded by distance flown instead of time
struct RouteEncounterDescriptor {
    double path_length;          // Longitudinal extent of each route
    double ground_speed_1;       // Ground speed of the first flight
    double ground_speed_2;       // Ground speed of the second flight
    double lateral_separation;   // Nominal lateral separation between the routes
    Vector3 aircraft_size;       // Size of aircraft collision volume
    double op_intent_width;      // Full lateral size of the op intent
    double op_intent_height;     // Full vertical size of the op intent
    double p_containment;        // Joint lateral+vertical fraction inside op intent
    double lateral_exit_speed;   // Average lateral speed when leaving the op intent
    double vertical_exit_speed;  // Average vertical speed when leaving the op intent

    void validate() const;

    // Per-axis scale giving p_containment jointly (no longitudinal deviation)
    Vector3 sigma() const;

    // Re-sampling interval, the more conservative of the lateral and vertical estimates
    double samplingInterval() const;
};

RouteEncounterDescriptor standardRouteDescriptor();

/**
 * Make a canonical flight path travelling longitudinally (x axis).
 *
 * The flight starts at x=0, t=0 and moves nominally dx forward for every
 * time step dt. Each waypoint carries an independent deviation from its
 * nominal position drawn with `sigma` (y, z, then x); deviations do not feed
 * into the following nominal position. Steps continue until time_length is
 * reached and the last waypoint is blended back so its time is exactly
 * time_length.
 */
FlightPath makeFlightPathAlongX(double time_length, double dx, double dt,
                                const Vector3& sigma, RandomSource& r);

// As makeFlightPathAlongX, but bounded by nominal distance: the last
// waypoint's nominal x is exactly path_length
FlightPath makeFlightPathAlongXByDistance(double path_length, double dx, double dt,
                                          const Vector3& sigma, RandomSource& r);

Flight makeFlight(double time_length, double ground_speed, double sampling_frequency,
                  double lateral_position, const Vector3& sigma,
                  const Vector3& aircraft_size, RandomSource& r);

// Generate 2 flights on parallel paths for a longitudinal encounter. Flight 1
// (at -lateral_separation/2) draws from r before flight 2.
std::vector<Flight> makeParallelPaths(const ParallelPathsEncounterDescriptor& encounter,
                                      RandomSource& r);
std::vector<Flight> makeParallelPaths(RandomSource& r);

// As makeParallelPaths, then the second flight's path is mirrored in x
std::vector<Flight> makeParallelPathsOppositeDirection(
    const ParallelPathsEncounterDescriptor& encounter, RandomSource& r);
std::vector<Flight> makeParallelPathsOppositeDirection(RandomSource& r);

std::vector<Flight> makeRouteFlights(const RouteEncounterDescriptor& encounter, RandomSource& r);
std::vector<Flight> makeRouteFlightsOppositeDirection(const RouteEncounterDescriptor& encounter,
                                                      RandomSource& r);

} // namespace discrete
} // namespace encgen

#endif // ENCGEN_DISCRETE_SAMPLING_MODEL_H
