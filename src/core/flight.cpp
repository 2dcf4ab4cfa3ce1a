#include "core/flight.h"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace encgen {

Flight::Flight(FlightPath flight_path, const OperationalIntent& intent, const Vector3& aircraft_size)
    : path(std::move(flight_path))
    , op_intent(intent)
    , size(aircraft_size) {
    if (!op_intent.isValid()) {
        std::ostringstream oss;
        oss << "Operational intent lower corner " << op_intent.lower
            << " exceeds upper corner " << op_intent.upper;
        throw std::invalid_argument(oss.str());
    }
    if (!size.allPositive()) {
        std::ostringstream oss;
        oss << "Aircraft size must be strictly positive, got " << size;
        throw std::invalid_argument(oss.str());
    }
}

OperationalIntent Flight::boundsAt(double t) const {
    Vector3 location = locationAt(t);
    return OperationalIntent{location - size / 2, location + size / 2};
}

} // namespace encgen
