#include "display/encounter_report.h"
#include "common/constants.h"
#include <iomanip>
#include <sstream>

namespace encgen {

constexpr int EncounterReport::COLUMN_WIDTH;
constexpr int EncounterReport::PRECISION;
constexpr size_t EncounterReport::RULE_WIDTH;

EncounterReport::EncounterReport(std::ostream& out, bool use_color)
    : out_(out)
    , use_color_(use_color) {
}

void EncounterReport::write(const std::string& model, const std::vector<Flight>& flights,
                            const EncounterMonitor& monitor) {
    EncounterSummary summary = monitor.scan(flights);

    writeHeader(model, flights.size());
    writeFlightDetails(flights);
    writeSampleTable(flights, monitor);
    writeSeparationAnalysis(summary);
    writeSummary(summary);
}

void EncounterReport::writeHeader(const std::string& model, size_t flight_count) {
    std::ostringstream buffer;
    buffer << "=== Encounter Report (encgen " << constants::SYSTEM_VERSION << ") ===\n";
    buffer << "Model: " << model << "\n";
    buffer << "Flights: " << flight_count << "\n";
    buffer << std::string(RULE_WIDTH, '-') << "\n";
    out_ << buffer.str();
}

void EncounterReport::writeFlightDetails(const std::vector<Flight>& flights) {
    std::ostringstream buffer;
    buffer << std::fixed << std::setprecision(PRECISION) << "\nFlight Details:\n";

    for (size_t i = 0; i < flights.size(); ++i) {
        const Flight& flight = flights[i];
        buffer << "Flight " << (i + 1) << "\n"
               << "  Waypoints: " << flight.path.size()
               << " over t = [" << flight.path.tMin() << ", " << flight.path.tMax() << "]\n"
               << "  Start: " << formatPosition(flight.locationAt(flight.path.tMin())) << "\n"
               << "  End: " << formatPosition(flight.locationAt(flight.path.tMax())) << "\n"
               << "  Op intent: " << formatPosition(flight.op_intent.lower)
               << " to " << formatPosition(flight.op_intent.upper) << "\n"
               << "  Aircraft size: " << formatPosition(flight.size) << "\n";
    }
    out_ << buffer.str();
}

void EncounterReport::writeSampleTable(const std::vector<Flight>& flights,
                                       const EncounterMonitor& monitor) {
    std::ostringstream buffer;
    buffer << "\nSamples (step " << monitor.getStep() << "):\n";
    buffer << std::setw(COLUMN_WIDTH) << "t";
    for (size_t i = 0; i < flights.size(); ++i) {
        std::string prefix = "F" + std::to_string(i + 1);
        buffer << std::setw(COLUMN_WIDTH) << prefix + ".x"
               << std::setw(COLUMN_WIDTH) << prefix + ".y"
               << std::setw(COLUMN_WIDTH) << prefix + ".z"
               << std::setw(COLUMN_WIDTH + 4) << prefix + ".status";
    }
    buffer << "\n";

    buffer << std::fixed << std::setprecision(PRECISION);
    for (double t : monitor.sampleTimes(flights)) {
        EncounterSample s = monitor.sample(flights, t);
        buffer << std::setw(COLUMN_WIDTH) << s.t;
        for (size_t i = 0; i < flights.size(); ++i) {
            const Vector3& p = s.positions[i];
            buffer << std::setw(COLUMN_WIDTH) << p.x
                   << std::setw(COLUMN_WIDTH) << p.y
                   << std::setw(COLUMN_WIDTH) << p.z;
            buffer << getConformanceColor(s.conformance[i].level)
                   << std::setw(COLUMN_WIDTH + 4)
                   << getConformanceLevelString(s.conformance[i].level)
                   << resetColor();
        }
        buffer << "\n";
    }
    out_ << buffer.str();
}

void EncounterReport::writeSeparationAnalysis(const EncounterSummary& summary) {
    std::ostringstream buffer;
    buffer << "\nSeparation Analysis:\n";
    if (summary.samples == 0 || summary.containment_fraction.size() < 2) {
        buffer << "  No aircraft pairs\n";
    } else {
        buffer << std::fixed << std::setprecision(PRECISION)
               << "  Minimum separation per axis: " << formatPosition(summary.min_separation) << "\n"
               << "  Collision box overlap: " << summary.overlap_duration << "s\n";
    }
    out_ << buffer.str();
}

void EncounterReport::writeSummary(const EncounterSummary& summary) {
    std::ostringstream buffer;
    buffer << std::fixed << std::setprecision(PRECISION)
           << "\nSummary:\n"
           << "  Samples: " << summary.samples << " up to t = " << summary.t_end << "\n";

    for (size_t i = 0; i < summary.containment_fraction.size(); ++i) {
        buffer << "  Flight " << (i + 1)
               << ": centre in op intent " << summary.containment_fraction[i] * 100 << "%"
               << ", conforming " << summary.conforming_fraction[i] * 100 << "%\n";
    }
    buffer << std::string(RULE_WIDTH, '-') << "\n";
    out_ << buffer.str();
}

void EncounterReport::writeFrame(size_t encounter, double t, const std::vector<Flight>& flights) {
    std::ostringstream buffer;
    buffer << std::fixed << std::setprecision(PRECISION)
           << "[encounter " << encounter << "] t=" << std::setw(8) << t;
    for (size_t i = 0; i < flights.size(); ++i) {
        ConformanceReport report = evaluateConformance(flights[i], t);
        buffer << "  F" << (i + 1) << " "
               << getConformanceColor(report.level)
               << formatPosition(flights[i].locationAt(t))
               << resetColor();
    }
    buffer << "\n";
    out_ << buffer.str();
}

void EncounterReport::writeContainment(const std::string& model, int trials, double fraction) {
    std::ostringstream buffer;
    buffer << std::fixed << std::setprecision(PRECISION)
           << "Containment (" << model << ", " << trials << " encounters): "
           << fraction * 100 << "%\n";
    out_ << buffer.str();
}

std::string EncounterReport::formatPosition(const Vector3& pos) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(PRECISION)
       << "(" << pos.x << ", " << pos.y << ", " << pos.z << ")";
    return ss.str();
}

const char* EncounterReport::getConformanceColor(ConformanceLevel level) const {
    if (!use_color_) {
        return "";
    }
    switch (level) {
        case ConformanceLevel::NON_CONFORMING: return "\033[1;31m";  // Bright red
        case ConformanceLevel::STRADDLING:     return "\033[33m";    // Yellow
        default:                               return "\033[32m";    // Green
    }
}

const char* EncounterReport::resetColor() const {
    return use_color_ ? "\033[0m" : "";
}

} // namespace encgen
