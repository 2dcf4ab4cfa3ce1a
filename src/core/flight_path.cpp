#include "core/flight_path.h"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace encgen {

FlightPath::FlightPath(std::vector<Waypoint> waypoints)
    : waypoints_(validated(std::move(waypoints)))
    , x_of_t_(column(waypoints_, &Waypoint::x))
    , y_of_t_(column(waypoints_, &Waypoint::y))
    , z_of_t_(column(waypoints_, &Waypoint::z)) {
}

std::vector<Waypoint> FlightPath::validated(std::vector<Waypoint> waypoints) {
    if (waypoints.size() < 2) {
        throw std::invalid_argument("Flight path needs at least 2 waypoints, got " +
                                    std::to_string(waypoints.size()));
    }

    for (size_t i = 0; i < waypoints.size(); ++i) {
        const auto& wp = waypoints[i];
        if (!std::isfinite(wp.t) || !std::isfinite(wp.x) ||
            !std::isfinite(wp.y) || !std::isfinite(wp.z)) {
            throw std::invalid_argument("Non-finite value in waypoint " + std::to_string(i));
        }
        if (i > 0 && !(wp.t > waypoints[i - 1].t)) {
            throw std::invalid_argument("Waypoint times must be strictly ascending (waypoint " +
                                        std::to_string(i) + ")");
        }
    }
    return waypoints;
}

PiecewiseLinear FlightPath::column(const std::vector<Waypoint>& waypoints, double Waypoint::*member) {
    std::vector<double> times;
    std::vector<double> values;
    times.reserve(waypoints.size());
    values.reserve(waypoints.size());
    for (const auto& wp : waypoints) {
        times.push_back(wp.t);
        values.push_back(wp.*member);
    }
    return PiecewiseLinear(std::move(times), std::move(values));
}

FlightPath FlightPath::offset(double dt, double dx, double dy, double dz) const {
    std::vector<Waypoint> m = waypoints_;
    for (auto& wp : m) {
        wp.t += dt;
        wp.x += dx;
        wp.y += dy;
        wp.z += dz;
    }
    return FlightPath(std::move(m));
}

FlightPath FlightPath::scale(double ft, double fx, double fy, double fz) const {
    std::vector<Waypoint> m = waypoints_;
    for (auto& wp : m) {
        wp.t *= ft;
        wp.x *= fx;
        wp.y *= fy;
        wp.z *= fz;
    }
    return FlightPath(std::move(m));
}

Vector3 FlightPath::locationAt(double t) const {
    return Vector3{
        x_of_t_.evaluate(t),
        y_of_t_.evaluate(t),
        z_of_t_.evaluate(t)
    };
}

} // namespace encgen
