#include "common/constants.h"
#include <cmath>

namespace encgen {
namespace constants {

const double M_PER_FT = 0.3048;

// Standard parallel-route encounter
const double STANDARD_LATERAL_SEPARATION = 15 * M_PER_FT;
const double STANDARD_AIRCRAFT_LENGTH = 2 * M_PER_FT;
const double STANDARD_AIRCRAFT_WINGSPAN = 2 * M_PER_FT;
const double STANDARD_AIRCRAFT_HEIGHT = 2 * M_PER_FT;
const double STANDARD_OP_HALF_WIDTH = 7 * M_PER_FT;
const double STANDARD_OP_HALF_HEIGHT = 7 * M_PER_FT;
const double STANDARD_FLIGHT_DURATION = 3600.0;
const double STANDARD_NOMINAL_SPEED = 20 * M_PER_FT;
const double STANDARD_RELATIVE_SPEED = 5 * M_PER_FT;
const double STANDARD_RELATIVE_LATERAL_SPEED = 7.75 * M_PER_FT;
const double STANDARD_RELATIVE_VERTICAL_SPEED = 7.75 * M_PER_FT;

// Containment
const double OP_INTENT_CONTAINMENT = 0.95;
const double OP_INTENT_AXIS_CONTAINMENT = std::sqrt(OP_INTENT_CONTAINMENT);
const double OP_INTENT_SIGMA_MULTIPLIER = 4.0;

// Reich model viewing window
const double VIEW_WINDOW_BUFFER = 1.2;
const double VIEW_WINDOW_MIN = 3.0;

// Discrete sampling model
const double DISCRETE_TIME_HORIZON = 5.0;
const double STANDARD_ROUTE_LENGTH = 100 * M_PER_FT;

// Simulated calibration; do not re-derive
const std::vector<std::pair<double, double>> CAFFEINATION_TABLE = {
    {0.8,   0.633},
    {0.9,   0.579},
    {0.95,  0.554},
    {0.99,  0.531},
    {0.999, 0.52}
};

const std::string SYSTEM_VERSION = "1.0.0";

} // namespace constants
} // namespace encgen
