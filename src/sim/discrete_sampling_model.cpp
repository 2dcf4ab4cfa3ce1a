#include "sim/discrete_sampling_model.h"
#include "common/constants.h"
#include "common/logger.h"
#include "core/statistics_util.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace encgen {
namespace discrete {

namespace {

void requirePositive(double value, const std::string& name) {
    if (!(value > 0) || !std::isfinite(value)) {
        throw std::invalid_argument(name + " must be positive and finite, got " +
                                    std::to_string(value));
    }
}

void requireFinite(double value, const std::string& name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(name + " must be finite");
    }
}

// Replace the last waypoint by the blend f*last + (1-f)*previous
void truncateLast(std::vector<Waypoint>& m, double f) {
    const Waypoint w0 = m[m.size() - 2];
    const Waypoint w1 = m.back();
    m.back() = Waypoint{
        f * w1.t + (1 - f) * w0.t,
        f * w1.x + (1 - f) * w0.x,
        f * w1.y + (1 - f) * w0.y,
        f * w1.z + (1 - f) * w0.z
    };
}

Waypoint drawWaypoint(double t, double x_nominal, const Vector3& sigma, RandomSource& r) {
    double y = r.gauss(0, sigma.y);
    double z = r.gauss(0, sigma.z);
    double x_dev = r.gauss(0, sigma.x);
    return Waypoint{t, x_nominal + x_dev, y, z};
}

// Op intent centred on (0, lateral_position, 0): the longitudinal extent of
// the path padded by sigma_x and one aircraft length, lateral and vertical
// extents holding the per-axis containment fraction
OperationalIntent makeOpIntent(double path_length, double lateral_position,
                               const Vector3& sigma, const Vector3& aircraft_size) {
    const Vector3 center{0, lateral_position, 0};
    const Vector3 op_intent_size{
        std::abs(path_length) + 2 * constants::OP_INTENT_SIGMA_MULTIPLIER * sigma.x + aircraft_size.x,
        stats::computeVolumeSize(sigma.y, constants::OP_INTENT_AXIS_CONTAINMENT),
        stats::computeVolumeSize(sigma.z, constants::OP_INTENT_AXIS_CONTAINMENT)
    };
    return OperationalIntent{center - op_intent_size / 2, center + op_intent_size / 2};
}

void logEncounter(const std::string& kind, const std::vector<Flight>& flights) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << kind << " encounter:";
    for (size_t i = 0; i < flights.size(); ++i) {
        oss << " flight " << (i + 1) << " " << flights[i].path.size()
            << " waypoints to t=" << flights[i].path.tMax() << "s;";
    }
    Logger::getInstance().log(oss.str());
}

void mirrorSecondFlight(std::vector<Flight>& flights) {
    flights[1].path = flights[1].path.scale(1, -1);
}

} // namespace

void ParallelPathsEncounterDescriptor::validate() const {
    requirePositive(time_length, "time_length");
    requirePositive(sampling_frequency, "sampling_frequency");
    requireFinite(v1_ground, "v1_ground");
    requireFinite(v2_ground, "v2_ground");
    requireFinite(lateral_separation, "lateral_separation");
    if (!aircraft_size.allPositive()) {
        throw std::invalid_argument("aircraft_size must be strictly positive");
    }
    for (int a = 0; a < 3; ++a) {
        if (!(sigma[a] >= 0) || !std::isfinite(sigma[a])) {
            throw std::invalid_argument("sigma components must be non-negative and finite");
        }
    }
}

ParallelPathsEncounterDescriptor makeParallelPathsDescriptor(
    const reich::ParallelPathsEncounterDescriptor& reich) {
    reich.validate();

    const double op_intent_width = 2 * reich.op_half_width;
    const double op_intent_height = 2 * reich.op_half_height;
    const double p_one_axis = constants::OP_INTENT_AXIS_CONTAINMENT;

    // Worst-case (shortest) interval of the two axes
    const double dt_y = stats::inferCaffeination(p_one_axis, reich.relative_lateral_speed, op_intent_width);
    const double dt_z = stats::inferCaffeination(p_one_axis, reich.relative_vertical_speed, op_intent_height);
    const double dt = std::min(dt_y, dt_z);

    ParallelPathsEncounterDescriptor d;
    // The discrete model has no natural time limit
    d.time_length = constants::DISCRETE_TIME_HORIZON;
    d.v1_ground = reich.nominal_speed;
    d.v2_ground = reich.nominal_speed - reich.relative_speed;
    d.lateral_separation = reich.lateral_separation;
    d.aircraft_size = reich.aircraftSize();
    d.sampling_frequency = 1 / dt;
    d.sigma = Vector3{
        0,
        stats::computeSigma(op_intent_width, p_one_axis),
        stats::computeSigma(op_intent_height, p_one_axis)
    };
    return d;
}

ParallelPathsEncounterDescriptor makeParallelPathsDescriptor() {
    return makeParallelPathsDescriptor(reich::standardParallelPathsDescriptor());
}

void RouteEncounterDescriptor::validate() const {
    requirePositive(path_length, "path_length");
    requirePositive(ground_speed_1, "ground_speed_1");
    requirePositive(ground_speed_2, "ground_speed_2");
    requireFinite(lateral_separation, "lateral_separation");
    if (!aircraft_size.allPositive()) {
        throw std::invalid_argument("aircraft_size must be strictly positive");
    }
    requirePositive(op_intent_width, "op_intent_width");
    requirePositive(op_intent_height, "op_intent_height");
    stats::requireContainmentFraction(p_containment, "p_containment");
    requirePositive(lateral_exit_speed, "lateral_exit_speed");
    requirePositive(vertical_exit_speed, "vertical_exit_speed");
}

Vector3 RouteEncounterDescriptor::sigma() const {
    const double p_one_axis = std::sqrt(p_containment);
    return Vector3{
        0,
        stats::computeSigma(op_intent_width, p_one_axis),
        stats::computeSigma(op_intent_height, p_one_axis)
    };
}

double RouteEncounterDescriptor::samplingInterval() const {
    const double p_one_axis = std::sqrt(p_containment);
    return std::min(
        stats::inferCaffeination(p_one_axis, lateral_exit_speed, op_intent_width),
        stats::inferCaffeination(p_one_axis, vertical_exit_speed, op_intent_height));
}

RouteEncounterDescriptor standardRouteDescriptor() {
    RouteEncounterDescriptor d;
    d.path_length = constants::STANDARD_ROUTE_LENGTH;
    d.ground_speed_1 = constants::STANDARD_NOMINAL_SPEED;
    d.ground_speed_2 = constants::STANDARD_NOMINAL_SPEED - constants::STANDARD_RELATIVE_SPEED;
    d.lateral_separation = constants::STANDARD_LATERAL_SEPARATION;
    d.aircraft_size = Vector3{constants::STANDARD_AIRCRAFT_LENGTH,
                              constants::STANDARD_AIRCRAFT_WINGSPAN,
                              constants::STANDARD_AIRCRAFT_HEIGHT};
    d.op_intent_width = 2 * constants::STANDARD_OP_HALF_WIDTH;
    d.op_intent_height = 2 * constants::STANDARD_OP_HALF_HEIGHT;
    d.p_containment = constants::OP_INTENT_CONTAINMENT;
    d.lateral_exit_speed = constants::STANDARD_RELATIVE_LATERAL_SPEED;
    d.vertical_exit_speed = constants::STANDARD_RELATIVE_VERTICAL_SPEED;
    return d;
}

FlightPath makeFlightPathAlongX(double time_length, double dx, double dt,
                                const Vector3& sigma, RandomSource& r) {
    requirePositive(time_length, "time_length");
    requirePositive(dt, "dt");
    requireFinite(dx, "dx");

    // Generate key points until we reach time_length. Nominal positions are
    // computed from the step count so they do not accumulate rounding error.
    std::vector<Waypoint> m;
    double t = 0;
    for (size_t step = 0; m.empty() || t < time_length; ++step) {
        t = step * dt;
        m.push_back(drawWaypoint(t, step * dx, sigma, r));
    }

    truncateLast(m, (time_length - m[m.size() - 2].t) / dt);
    m.back().t = time_length;

    Logger::getInstance().log(LogLevel::DEBUG,
        "Sampled " + std::to_string(m.size()) + " waypoints over " +
        std::to_string(time_length) + "s");
    return FlightPath(std::move(m));
}

FlightPath makeFlightPathAlongXByDistance(double path_length, double dx, double dt,
                                          const Vector3& sigma, RandomSource& r) {
    requirePositive(path_length, "path_length");
    requirePositive(dx, "dx");
    requirePositive(dt, "dt");

    std::vector<Waypoint> m;
    double x = 0;
    for (size_t step = 0; m.empty() || x < path_length; ++step) {
        x = step * dx;
        m.push_back(drawWaypoint(step * dt, x, sigma, r));
    }

    const double x_previous = (m.size() - 2) * dx;
    truncateLast(m, (path_length - x_previous) / dx);

    Logger::getInstance().log(LogLevel::DEBUG,
        "Sampled " + std::to_string(m.size()) + " waypoints over " +
        std::to_string(path_length) + "m");
    return FlightPath(std::move(m));
}

Flight makeFlight(double time_length, double ground_speed, double sampling_frequency,
                  double lateral_position, const Vector3& sigma,
                  const Vector3& aircraft_size, RandomSource& r) {
    const double path_length = time_length * ground_speed;
    const double dt = 1 / sampling_frequency;
    const double dx = ground_speed * dt;

    FlightPath path = makeFlightPathAlongX(time_length, dx, dt, sigma, r)
        .offset(0, -path_length / 2, lateral_position);
    return Flight(std::move(path),
                  makeOpIntent(path_length, lateral_position, sigma, aircraft_size),
                  aircraft_size);
}

std::vector<Flight> makeParallelPaths(const ParallelPathsEncounterDescriptor& encounter,
                                      RandomSource& r) {
    encounter.validate();

    std::vector<Flight> flights;
    flights.reserve(2);
    flights.push_back(makeFlight(
        encounter.time_length, encounter.v1_ground, encounter.sampling_frequency,
        -encounter.lateral_separation / 2, encounter.sigma, encounter.aircraft_size, r));
    flights.push_back(makeFlight(
        encounter.time_length, encounter.v2_ground, encounter.sampling_frequency,
        encounter.lateral_separation / 2, encounter.sigma, encounter.aircraft_size, r));

    logEncounter("Discrete sampling", flights);
    return flights;
}

std::vector<Flight> makeParallelPaths(RandomSource& r) {
    return makeParallelPaths(makeParallelPathsDescriptor(), r);
}

std::vector<Flight> makeParallelPathsOppositeDirection(
    const ParallelPathsEncounterDescriptor& encounter, RandomSource& r) {
    std::vector<Flight> flights = makeParallelPaths(encounter, r);
    mirrorSecondFlight(flights);
    return flights;
}

std::vector<Flight> makeParallelPathsOppositeDirection(RandomSource& r) {
    return makeParallelPathsOppositeDirection(makeParallelPathsDescriptor(), r);
}

std::vector<Flight> makeRouteFlights(const RouteEncounterDescriptor& encounter, RandomSource& r) {
    encounter.validate();

    const Vector3 sigma = encounter.sigma();
    const double dt = encounter.samplingInterval();
    const double half_separation = encounter.lateral_separation / 2;

    std::vector<Flight> flights;
    flights.reserve(2);
    const double speeds[] = {encounter.ground_speed_1, encounter.ground_speed_2};
    const double lateral_positions[] = {-half_separation, half_separation};
    for (int i = 0; i < 2; ++i) {
        FlightPath path = makeFlightPathAlongXByDistance(
            encounter.path_length, speeds[i] * dt, dt, sigma, r)
            .offset(0, -encounter.path_length / 2, lateral_positions[i]);
        flights.emplace_back(std::move(path),
                             makeOpIntent(encounter.path_length, lateral_positions[i],
                                          sigma, encounter.aircraft_size),
                             encounter.aircraft_size);
    }

    logEncounter("Route", flights);
    return flights;
}

std::vector<Flight> makeRouteFlightsOppositeDirection(const RouteEncounterDescriptor& encounter,
                                                      RandomSource& r) {
    std::vector<Flight> flights = makeRouteFlights(encounter, r);
    mirrorSecondFlight(flights);
    return flights;
}

} // namespace discrete
} // namespace encgen
