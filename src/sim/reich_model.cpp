#include "sim/reich_model.h"
#include "common/constants.h"
#include "common/errors.h"
#include "common/logger.h"
#include "core/statistics_util.h"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace encgen {
namespace reich {

namespace {

void requirePositive(double value, const std::string& name) {
    if (!(value > 0) || !std::isfinite(value)) {
        throw std::invalid_argument("Reich descriptor field " + name +
                                    " must be positive and finite, got " +
                                    std::to_string(value));
    }
}

// Keep only key times strictly inside the viewing window
void addKeyTimes(std::vector<double>& keys, std::initializer_list<double> candidates, double dt_view) {
    for (double t : candidates) {
        if (0 < t && t < dt_view) {
            keys.push_back(t);
        }
    }
}

FlightPath resample(std::vector<double> t_key, const PiecewiseLinear& fx,
                    const PiecewiseLinear& fy, double z) {
    std::sort(t_key.begin(), t_key.end());
    t_key.erase(std::unique(t_key.begin(), t_key.end()), t_key.end());

    std::vector<Waypoint> m;
    m.reserve(t_key.size());
    for (double t : t_key) {
        m.push_back(Waypoint{t, fx.evaluate(t), fy.evaluate(t), z});
    }
    return FlightPath(std::move(m));
}

// x bounds cover the longitudinal window inflated by one aircraft length;
// lateral/vertical bounds are a w x h half-size box about the nominal route
OperationalIntent makeOpIntent(const ParallelPathsEncounterDescriptor& encounter,
                               const PiecewiseLinear& fx, double dt_view,
                               double nominal_y) {
    double xa = fx.evaluate(0);
    double xb = fx.evaluate(dt_view);
    return OperationalIntent{
        Vector3{std::min(xa, xb) - encounter.aircraft_length,
                nominal_y - encounter.op_half_width,
                -encounter.op_half_height},
        Vector3{std::max(xa, xb) + encounter.aircraft_length,
                nominal_y + encounter.op_half_width,
                encounter.op_half_height}
    };
}

} // namespace

void ParallelPathsEncounterDescriptor::validate() const {
    requirePositive(lateral_separation, "lateral_separation");
    requirePositive(aircraft_length, "aircraft_length");
    requirePositive(aircraft_wingspan, "aircraft_wingspan");
    requirePositive(aircraft_height, "aircraft_height");
    requirePositive(op_half_width, "op_half_width");
    requirePositive(op_half_height, "op_half_height");
    requirePositive(flight_duration, "flight_duration");
    requirePositive(relative_lateral_speed, "relative_lateral_speed");
    requirePositive(relative_vertical_speed, "relative_vertical_speed");
    if (!std::isfinite(nominal_speed) || !std::isfinite(relative_speed)) {
        throw std::invalid_argument("Reich descriptor speeds must be finite");
    }
}

ParallelPathsEncounterDescriptor standardParallelPathsDescriptor() {
    ParallelPathsEncounterDescriptor d;
    d.lateral_separation = constants::STANDARD_LATERAL_SEPARATION;
    d.aircraft_length = constants::STANDARD_AIRCRAFT_LENGTH;
    d.aircraft_wingspan = constants::STANDARD_AIRCRAFT_WINGSPAN;
    d.aircraft_height = constants::STANDARD_AIRCRAFT_HEIGHT;
    d.op_half_width = constants::STANDARD_OP_HALF_WIDTH;
    d.op_half_height = constants::STANDARD_OP_HALF_HEIGHT;
    d.flight_duration = constants::STANDARD_FLIGHT_DURATION;
    d.nominal_speed = constants::STANDARD_NOMINAL_SPEED;
    d.relative_speed = constants::STANDARD_RELATIVE_SPEED;
    d.relative_lateral_speed = constants::STANDARD_RELATIVE_LATERAL_SPEED;
    d.relative_vertical_speed = constants::STANDARD_RELATIVE_VERTICAL_SPEED;
    return d;
}

OverlapDurations computeOverlapDurations(const ParallelPathsEncounterDescriptor& encounter) {
    return OverlapDurations{
        std::abs(2 * encounter.aircraft_length / encounter.relative_speed),
        2 * encounter.aircraft_wingspan / encounter.relative_lateral_speed,
        2 * encounter.aircraft_height / encounter.relative_vertical_speed
    };
}

double computeViewDuration(const ParallelPathsEncounterDescriptor& encounter) {
    OverlapDurations overlap = computeOverlapDurations(encounter);
    double longest = std::max({overlap.longitudinal, overlap.lateral, overlap.vertical});
    return std::max(longest * constants::VIEW_WINDOW_BUFFER, constants::VIEW_WINDOW_MIN);
}

PiecewiseLinear makeLongitudinalPath(double speed, double dt_view) {
    // x(t) = speed * (t - dt_view/2), so x = 0 at the middle of the window
    return PiecewiseLinear(
        {0.0, dt_view},
        {speed * (0 - dt_view / 2), speed * (dt_view - dt_view / 2)});
}

PiecewiseLinear makeDeviationPath(double nominal_position, double deviation_speed,
                                  double t_overlap, double overlap_position) {
    double dt_transition = std::abs((overlap_position - nominal_position) / deviation_speed);
    if (!std::isfinite(dt_transition)) {
        return PiecewiseLinear::constant(overlap_position);
    }

    // Nominal position is held before and after the outer knots
    return PiecewiseLinear(
        {t_overlap - dt_transition, t_overlap, t_overlap + dt_transition},
        {nominal_position, overlap_position, nominal_position});
}

std::vector<Flight> makeParallelPaths(const ParallelPathsEncounterDescriptor& encounter,
                                      RandomSource& r) {
    if (encounter.relative_speed == 0) {
        Logger::getInstance().log(LogLevel::ERROR,
            "Reich model rejected descriptor with zero relative longitudinal speed");
        throw UnsupportedConfiguration(
            "Not sure how to model the movement of two aircraft flying in side-by-side formation");
    }
    encounter.validate();

    const OverlapDurations overlap = computeOverlapDurations(encounter);
    const double dt_view = computeViewDuration(encounter);
    const double half_separation = encounter.lateral_separation / 2;

    // === Loss of longitudinal separation ===
    // Both aircraft reach x = 0 at dt_view/2
    const PiecewiseLinear fx1 = makeLongitudinalPath(encounter.nominal_speed, dt_view);
    const PiecewiseLinear fx2 = makeLongitudinalPath(
        encounter.nominal_speed - encounter.relative_speed, dt_view);
    std::vector<double> t_key1{0.0, dt_view};
    std::vector<double> t_key2{0.0, dt_view};

    // === Loss of lateral separation ===
    // With Y_1 ~ N(-S_y/2, sigma_y) and Y_2 ~ N(S_y/2, sigma_y), the overlap
    // position given Y_1 = Y_2 is distributed N(0, sigma_y/sqrt(2))
    const double sigma_y = stats::computeSigma(encounter.op_half_width,
                                               constants::OP_INTENT_AXIS_CONTAINMENT);
    const double y_overlap = r.gauss(0, sigma_y / std::sqrt(2.0));

    // Overlap happens at a random time in an interval longer than the lateral
    // overlap duration by the ratio of lateral spacing to wingspan
    const double dt_lateral_overlap_interval =
        overlap.lateral * encounter.lateral_separation / encounter.aircraft_wingspan;
    const double t_overlap_y = r.uniform(-0.5, 0.5) * dt_lateral_overlap_interval;

    // Two lateral speeds from the average relative lateral speed. The draw is
    // taken modulo 0.5, so each speed stays below YS_y/sqrt(2).
    const double ys_y_squared = std::pow(encounter.relative_lateral_speed, 2);
    const double v1_y = std::sqrt(std::fmod(r.uniform(0, 1), 0.5) * ys_y_squared);
    const double v2_y = -std::sqrt(std::fmod(r.uniform(0, 1), 0.5) * ys_y_squared);

    const PiecewiseLinear fy1 = makeDeviationPath(-half_separation, v1_y, t_overlap_y, y_overlap);
    const PiecewiseLinear fy2 = makeDeviationPath(half_separation, v2_y, t_overlap_y, y_overlap);

    const double dt1_y = std::abs((y_overlap + half_separation) / v1_y);
    const double dt2_y = std::abs((y_overlap - half_separation) / v2_y);
    addKeyTimes(t_key1, {t_overlap_y, t_overlap_y - dt1_y, t_overlap_y + dt1_y}, dt_view);
    addKeyTimes(t_key2, {t_overlap_y, t_overlap_y - dt2_y, t_overlap_y + dt2_y}, dt_view);

    // === Potential loss of vertical separation ===
    // Nominal vertical positions already overlap, so a deviation path does not
    // apply. One draw per aircraft, held for the whole encounter.
    const double sigma_z = stats::computeSigma(encounter.op_half_height,
                                               constants::OP_INTENT_AXIS_CONTAINMENT);
    const double z1 = r.gauss(0, sigma_z);
    const double z2 = r.gauss(0, sigma_z);

    const Vector3 aircraft_size = encounter.aircraftSize();

    std::vector<Flight> flights;
    flights.reserve(2);
    flights.emplace_back(resample(t_key1, fx1, fy1, z1),
                         makeOpIntent(encounter, fx1, dt_view, -half_separation),
                         aircraft_size);
    flights.emplace_back(resample(t_key2, fx2, fy2, z2),
                         makeOpIntent(encounter, fx2, dt_view, half_separation),
                         aircraft_size);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << "Reich encounter: window " << dt_view << "s, lateral overlap at t="
        << t_overlap_y << "s y=" << y_overlap
        << ", vertical offsets " << z1 << "/" << z2
        << ", waypoints " << flights[0].path.size() << "/" << flights[1].path.size();
    Logger::getInstance().log(oss.str());

    return flights;
}

std::vector<Flight> makeParallelPaths(RandomSource& r) {
    return makeParallelPaths(standardParallelPathsDescriptor(), r);
}

} // namespace reich
} // namespace encgen
