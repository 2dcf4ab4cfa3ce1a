#ifndef ENCGEN_ENCOUNTER_MONITOR_H
#define ENCGEN_ENCOUNTER_MONITOR_H

#include "common/random_source.h"
#include "common/types.h"
#include "core/conformance.h"
#include "core/flight.h"
#include <cstddef>
#include <vector>

namespace encgen {

struct PairSeparation {
    size_t first;
    size_t second;
    Vector3 separation;  // absolute centre-to-centre distance per axis
    bool overlap;        // collision boxes intersect on all three axes
};

struct EncounterSample {
    double t;
    std::vector<Vector3> positions;
    std::vector<ConformanceReport> conformance;
    std::vector<PairSeparation> pairs;
};

struct EncounterSummary {
    size_t samples;
    double t_end;
    Vector3 min_separation;                   // over all pairs and samples
    double overlap_duration;                  // seconds
    std::vector<double> containment_fraction; // per flight, centre inside op intent
    std::vector<double> conforming_fraction;  // per flight, whole box inside op intent
};

class EncounterMonitor {
public:
    explicit EncounterMonitor(double step);

    EncounterSample sample(const std::vector<Flight>& flights, double t) const;

    // Samples every step over [0, longest t_max], always including the end
    EncounterSummary scan(const std::vector<Flight>& flights) const;

    // Sample times scan() visits for these flights
    std::vector<double> sampleTimes(const std::vector<Flight>& flights) const;

    double getStep() const { return step_; }

    static bool isContained(const Vector3& position, const OperationalIntent& intent);

private:
    bool checkPairOverlap(const Flight& flight1, const Flight& flight2,
                          double t, PairSeparation& separation) const;

    double step_;
};

// Fraction of sampled aircraft positions inside their op intent, pooled over
// `trials` independently generated encounters
double measureContainment(const FlightGenerator& generate, int trials,
                          double step, RandomSource& r);

} // namespace encgen

#endif // ENCGEN_ENCOUNTER_MONITOR_H
