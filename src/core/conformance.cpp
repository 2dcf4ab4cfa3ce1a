#include "core/conformance.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace encgen {

AxisConformance classifyAxis(double lo, double hi, double lb, double ub) {
    if (lo >= lb && hi <= ub) {
        return AxisConformance::CONTAINED;
    }
    if (lo <= lb && lb <= hi) {
        return AxisConformance::STRADDLING_LOWER;
    }
    if (lo <= ub && ub <= hi) {
        return AxisConformance::STRADDLING_UPPER;
    }
    if (hi < lb) {
        return AxisConformance::BELOW;
    }
    if (lo > ub) {
        return AxisConformance::ABOVE;
    }

    // Only reachable with inverted or NaN intervals
    std::ostringstream oss;
    oss << "Cannot classify interval [" << lo << ", " << hi
        << "] against [" << lb << ", " << ub << "]";
    throw std::invalid_argument(oss.str());
}

ConformanceReport evaluateConformance(const Flight& flight, double t) {
    const OperationalIntent box = flight.boundsAt(t);
    const OperationalIntent& bound = flight.op_intent;

    ConformanceReport report;
    bool straddling = false;
    bool outside = false;

    for (int a = 0; a < 3; ++a) {
        double lo = box.lower[a];
        double hi = box.upper[a];
        double lb = bound.lower[a];
        double ub = bound.upper[a];

        AxisReport& axis = report.axes[a];
        axis.status = classifyAxis(lo, hi, lb, ub);
        axis.margin = std::min(lo - lb, ub - hi);

        switch (axis.status) {
            case AxisConformance::CONTAINED:
                break;
            case AxisConformance::STRADDLING_LOWER:
            case AxisConformance::STRADDLING_UPPER:
                straddling = true;
                break;
            case AxisConformance::BELOW:
            case AxisConformance::ABOVE:
                outside = true;
                break;
        }
    }

    if (outside) {
        report.level = ConformanceLevel::NON_CONFORMING;
    } else if (straddling) {
        report.level = ConformanceLevel::STRADDLING;
    } else {
        report.level = ConformanceLevel::CONFORMING;
    }
    return report;
}

std::string getAxisConformanceString(AxisConformance status) {
    switch (status) {
        case AxisConformance::CONTAINED:        return "CONTAINED";
        case AxisConformance::STRADDLING_LOWER: return "STRADDLING_LOWER";
        case AxisConformance::STRADDLING_UPPER: return "STRADDLING_UPPER";
        case AxisConformance::BELOW:            return "BELOW";
        case AxisConformance::ABOVE:            return "ABOVE";
        default:                                return "UNKNOWN";
    }
}

std::string getConformanceLevelString(ConformanceLevel level) {
    switch (level) {
        case ConformanceLevel::CONFORMING:     return "CONFORMING";
        case ConformanceLevel::STRADDLING:     return "STRADDLING";
        case ConformanceLevel::NON_CONFORMING: return "NON_CONFORMING";
        default:                               return "UNKNOWN";
    }
}

} // namespace encgen
