#ifndef ENCGEN_CONFORMANCE_H
#define ENCGEN_CONFORMANCE_H

#include "core/flight.h"
#include <array>
#include <string>

namespace encgen {

// Where an aircraft's box sits relative to its op intent along one axis
enum class AxisConformance {
    CONTAINED,
    STRADDLING_LOWER,
    STRADDLING_UPPER,
    BELOW,
    ABOVE
};

enum class ConformanceLevel {
    CONFORMING,
    STRADDLING,
    NON_CONFORMING
};

struct AxisReport {
    AxisConformance status;
    double margin;  // min(lo - lb, ub - hi); negative once the box crosses a boundary
};

struct ConformanceReport {
    std::array<AxisReport, 3> axes;
    ConformanceLevel level;

    bool isConforming() const { return level == ConformanceLevel::CONFORMING; }
    const AxisReport& axis(Axis a) const { return axes[static_cast<int>(a)]; }
};

// Classify box [lo, hi] against bound [lb, ub]; checks are made in enum order
AxisConformance classifyAxis(double lo, double hi, double lb, double ub);

ConformanceReport evaluateConformance(const Flight& flight, double t);

std::string getAxisConformanceString(AxisConformance status);
std::string getConformanceLevelString(ConformanceLevel level);

} // namespace encgen

#endif // ENCGEN_CONFORMANCE_H
