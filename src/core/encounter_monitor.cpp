#include "core/encounter_monitor.h"
#include "common/logger.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace encgen {

EncounterMonitor::EncounterMonitor(double step)
    : step_(step) {
    if (!(step_ > 0) || !std::isfinite(step_)) {
        throw std::invalid_argument("Monitor sample step must be positive and finite");
    }
}

bool EncounterMonitor::isContained(const Vector3& position, const OperationalIntent& intent) {
    return position.x >= intent.lower.x && position.x <= intent.upper.x &&
           position.y >= intent.lower.y && position.y <= intent.upper.y &&
           position.z >= intent.lower.z && position.z <= intent.upper.z;
}

bool EncounterMonitor::checkPairOverlap(const Flight& flight1, const Flight& flight2,
                                        double t, PairSeparation& separation) const {
    Vector3 p1 = flight1.locationAt(t);
    Vector3 p2 = flight2.locationAt(t);
    separation.separation = Vector3{
        std::abs(p1.x - p2.x),
        std::abs(p1.y - p2.y),
        std::abs(p1.z - p2.z)
    };

    // Boxes intersect when centres are closer than the mean size on every axis
    Vector3 reach = (flight1.size + flight2.size) / 2;
    separation.overlap = separation.separation.x < reach.x &&
                         separation.separation.y < reach.y &&
                         separation.separation.z < reach.z;
    return separation.overlap;
}

EncounterSample EncounterMonitor::sample(const std::vector<Flight>& flights, double t) const {
    EncounterSample result;
    result.t = t;

    for (const auto& flight : flights) {
        result.positions.push_back(flight.locationAt(t));
        result.conformance.push_back(evaluateConformance(flight, t));
    }

    for (size_t i = 0; i < flights.size(); ++i) {
        for (size_t j = i + 1; j < flights.size(); ++j) {
            PairSeparation pair;
            pair.first = i;
            pair.second = j;
            checkPairOverlap(flights[i], flights[j], t, pair);
            result.pairs.push_back(pair);
        }
    }
    return result;
}

std::vector<double> EncounterMonitor::sampleTimes(const std::vector<Flight>& flights) const {
    std::vector<double> times;
    if (flights.empty()) {
        return times;
    }

    double t_end = 0.0;
    for (const auto& flight : flights) {
        t_end = std::max(t_end, flight.path.tMax());
    }

    for (size_t k = 0; k * step_ < t_end; ++k) {
        times.push_back(k * step_);
    }
    times.push_back(t_end);
    return times;
}

EncounterSummary EncounterMonitor::scan(const std::vector<Flight>& flights) const {
    EncounterSummary summary;
    summary.samples = 0;
    summary.t_end = 0.0;
    summary.overlap_duration = 0.0;
    const double inf = std::numeric_limits<double>::infinity();
    summary.min_separation = Vector3{inf, inf, inf};
    summary.containment_fraction.assign(flights.size(), 0.0);
    summary.conforming_fraction.assign(flights.size(), 0.0);

    const std::vector<double> times = sampleTimes(flights);
    if (times.empty()) {
        return summary;
    }
    summary.t_end = times.back();

    for (size_t k = 0; k < times.size(); ++k) {
        EncounterSample s = sample(flights, times[k]);
        ++summary.samples;

        bool any_overlap = false;
        for (const auto& pair : s.pairs) {
            summary.min_separation.x = std::min(summary.min_separation.x, pair.separation.x);
            summary.min_separation.y = std::min(summary.min_separation.y, pair.separation.y);
            summary.min_separation.z = std::min(summary.min_separation.z, pair.separation.z);
            any_overlap = any_overlap || pair.overlap;
        }
        if (any_overlap && k + 1 < times.size()) {
            summary.overlap_duration += times[k + 1] - times[k];
        }

        for (size_t i = 0; i < flights.size(); ++i) {
            if (isContained(s.positions[i], flights[i].op_intent)) {
                summary.containment_fraction[i] += 1.0;
            }
            if (s.conformance[i].isConforming()) {
                summary.conforming_fraction[i] += 1.0;
            }
        }
    }

    for (size_t i = 0; i < flights.size(); ++i) {
        summary.containment_fraction[i] /= summary.samples;
        summary.conforming_fraction[i] /= summary.samples;
    }
    return summary;
}

double measureContainment(const FlightGenerator& generate, int trials,
                          double step, RandomSource& r) {
    if (trials <= 0) {
        throw std::invalid_argument("Containment measurement needs at least one trial");
    }

    EncounterMonitor monitor(step);
    size_t inside = 0;
    size_t total = 0;

    for (int trial = 0; trial < trials; ++trial) {
        std::vector<Flight> flights = generate(r);
        for (double t : monitor.sampleTimes(flights)) {
            for (const auto& flight : flights) {
                if (EncounterMonitor::isContained(flight.locationAt(t), flight.op_intent)) {
                    ++inside;
                }
                ++total;
            }
        }
    }

    double fraction = total > 0 ? static_cast<double>(inside) / total : 0.0;

    std::ostringstream oss;
    oss << "Containment over " << trials << " encounters: "
        << inside << "/" << total << " samples (" << fraction << ")";
    Logger::getInstance().log(oss.str());
    return fraction;
}

} // namespace encgen
