#ifndef ENCGEN_REICH_MODEL_H
#define ENCGEN_REICH_MODEL_H

#include "common/random_source.h"
#include "core/flight.h"
#include "core/piecewise_linear.h"
#include <vector>

namespace encgen {
namespace reich {

// Reich collision-risk inputs for two aircraft on parallel routes.
// Reich symbols are noted beside each field.
struct ParallelPathsEncounterDescriptor {
    double lateral_separation;       // S_y, minimum planned lateral separation
    double aircraft_length;          // lambda_x, average length
    double aircraft_wingspan;        // lambda_y, average wingspan
    double aircraft_height;          // lambda_z, average height
    double op_half_width;            // w, operational volume half cross-section, lateral
    double op_half_height;           // h, operational volume half cross-section, vertical
    double flight_duration;          // t, length of the flight. Not read by the
                                     // generator; the window comes from computeViewDuration
    double nominal_speed;            // v, nominal flight velocity
    double relative_speed;           // delta_v, average relative speed on parallel routes
    double relative_lateral_speed;   // YS_y, average relative lateral speed at loss of S_y
    double relative_vertical_speed;  // delta_z, average relative vertical speed, same route

    // Throws std::invalid_argument for non-physical values. A zero relative
    // speed is left to makeParallelPaths, which reports it as unsupported.
    void validate() const;

    Vector3 aircraftSize() const {
        return Vector3{aircraft_length, aircraft_wingspan, aircraft_height};
    }
};

ParallelPathsEncounterDescriptor standardParallelPathsDescriptor();

// Time the two aircraft overlap along each axis, 2 * lambda / relative speed
struct OverlapDurations {
    double longitudinal;
    double lateral;
    double vertical;
};

OverlapDurations computeOverlapDurations(const ParallelPathsEncounterDescriptor& encounter);

// Length of the viewing window: every overlap plus a buffer, with a floor
double computeViewDuration(const ParallelPathsEncounterDescriptor& encounter);

// Position along x over [0, dt_view] for an aircraft at `speed` that passes
// x = 0 at the middle of the window
PiecewiseLinear makeLongitudinalPath(double speed, double dt_view);

/**
 * Path that stays at nominal_position except for a short excursion to
 * overlap_position, reached at t_overlap, and back. Travel to and from the
 * excursion is at |deviation_speed|. With zero deviation speed the aircraft
 * is at overlap_position throughout.
 */
PiecewiseLinear makeDeviationPath(double nominal_position, double deviation_speed,
                                  double t_overlap, double overlap_position);

/**
 * Generate 2 flights on parallel paths for a longitudinal encounter.
 *
 * Draw order from r: lateral overlap position, overlap time, lateral speed
 * of flight 1, lateral speed of flight 2, vertical offset of flight 1,
 * vertical offset of flight 2.
 *
 * Throws UnsupportedConfiguration when relative_speed is zero (side-by-side
 * formation flight has no model).
 */
std::vector<Flight> makeParallelPaths(const ParallelPathsEncounterDescriptor& encounter,
                                      RandomSource& r);

// Standard descriptor
std::vector<Flight> makeParallelPaths(RandomSource& r);

} // namespace reich
} // namespace encgen

#endif // ENCGEN_REICH_MODEL_H
