#ifndef ENCGEN_CONSTANTS_H
#define ENCGEN_CONSTANTS_H

#include <string>
#include <utility>
#include <vector>

namespace encgen {
namespace constants {

// Unit conversion
extern const double M_PER_FT;

// Standard parallel-route encounter (Reich model inputs, metres and m/s)
extern const double STANDARD_LATERAL_SEPARATION;       // S_y, 15 ft
extern const double STANDARD_AIRCRAFT_LENGTH;          // lambda_x, 2 ft
extern const double STANDARD_AIRCRAFT_WINGSPAN;        // lambda_y, 2 ft
extern const double STANDARD_AIRCRAFT_HEIGHT;          // lambda_z, 2 ft
extern const double STANDARD_OP_HALF_WIDTH;            // w, 7 ft
extern const double STANDARD_OP_HALF_HEIGHT;           // h, 7 ft
extern const double STANDARD_FLIGHT_DURATION;          // t, seconds
extern const double STANDARD_NOMINAL_SPEED;            // v, 20 ft/s
extern const double STANDARD_RELATIVE_SPEED;           // delta_v, 5 ft/s
extern const double STANDARD_RELATIVE_LATERAL_SPEED;   // YS_y, 7.75 ft/s
extern const double STANDARD_RELATIVE_VERTICAL_SPEED;  // delta_z, 7.75 ft/s

// Containment
extern const double OP_INTENT_CONTAINMENT;        // Joint lateral+vertical fraction inside op intent
extern const double OP_INTENT_AXIS_CONTAINMENT;   // sqrt(OP_INTENT_CONTAINMENT), per axis
extern const double OP_INTENT_SIGMA_MULTIPLIER;   // Longitudinal op intent padding in sigma_x

// Reich model viewing window
extern const double VIEW_WINDOW_BUFFER;           // Multiplier on the longest overlap duration
extern const double VIEW_WINDOW_MIN;              // seconds

// Discrete sampling model
extern const double DISCRETE_TIME_HORIZON;        // seconds
extern const double STANDARD_ROUTE_LENGTH;        // metres

// Empirical (fraction inside bound, k) calibration for the re-sampling interval
extern const std::vector<std::pair<double, double>> CAFFEINATION_TABLE;

// System version
extern const std::string SYSTEM_VERSION;

} // namespace constants
} // namespace encgen

#endif // ENCGEN_CONSTANTS_H
