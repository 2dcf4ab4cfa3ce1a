#ifndef ENCGEN_FLIGHT_H
#define ENCGEN_FLIGHT_H

#include "common/random_source.h"
#include "common/types.h"
#include "core/flight_path.h"
#include <functional>
#include <vector>

namespace encgen {

struct Flight {
    Flight(FlightPath flight_path, const OperationalIntent& intent, const Vector3& aircraft_size);

    // Time-annotated path the aircraft will take. May be replaced wholesale.
    FlightPath path;

    // Operational intent volume; rectangular and aligned with the axes
    OperationalIntent op_intent;

    // Size of the aircraft's collision bounding box (a vector, not a point)
    Vector3 size;

    Vector3 locationAt(double t) const { return path.locationAt(t); }

    // Aircraft bounding box centred on its location at time t
    OperationalIntent boundsAt(double t) const;
};

// Anything that produces one encounter (two flights) from a random source
using FlightGenerator = std::function<std::vector<Flight>(RandomSource&)>;

} // namespace encgen

#endif // ENCGEN_FLIGHT_H
