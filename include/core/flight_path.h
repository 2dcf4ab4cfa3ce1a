#ifndef ENCGEN_FLIGHT_PATH_H
#define ENCGEN_FLIGHT_PATH_H

#include "common/types.h"
#include "core/piecewise_linear.h"
#include <vector>

namespace encgen {

struct Waypoint {
    double t;   // seconds since start of the encounter
    double x;
    double y;
    double z;

    Vector3 position() const { return Vector3{x, y, z}; }
};

// 4D trajectory an aircraft will take. Never modified after construction;
// offset() and scale() return new, independent paths.
class FlightPath {
public:
    // Needs at least 2 waypoints with finite values and strictly ascending t
    explicit FlightPath(std::vector<Waypoint> waypoints);

    FlightPath offset(double dt = 0, double dx = 0, double dy = 0, double dz = 0) const;
    FlightPath scale(double ft = 1, double fx = 1, double fy = 1, double fz = 1) const;

    // Per-axis linear interpolation; holds the end positions outside [t_min, t_max]
    Vector3 locationAt(double t) const;

    double tMin() const { return waypoints_.front().t; }
    double tMax() const { return waypoints_.back().t; }

    const std::vector<Waypoint>& getWaypoints() const { return waypoints_; }
    size_t size() const { return waypoints_.size(); }

private:
    static PiecewiseLinear column(const std::vector<Waypoint>& waypoints, double Waypoint::*member);
    static std::vector<Waypoint> validated(std::vector<Waypoint> waypoints);

    std::vector<Waypoint> waypoints_;
    PiecewiseLinear x_of_t_;
    PiecewiseLinear y_of_t_;
    PiecewiseLinear z_of_t_;
};

} // namespace encgen

#endif // ENCGEN_FLIGHT_PATH_H
