#ifndef ENCGEN_ENCOUNTER_REPORT_H
#define ENCGEN_ENCOUNTER_REPORT_H

#include "core/conformance.h"
#include "core/encounter_monitor.h"
#include "core/flight.h"
#include <ostream>
#include <string>
#include <vector>

namespace encgen {

// Text report of one generated encounter
class EncounterReport {
public:
    explicit EncounterReport(std::ostream& out, bool use_color = false);

    // Header, flight details, sample table, separation analysis and summary
    void write(const std::string& model, const std::vector<Flight>& flights,
               const EncounterMonitor& monitor);

    void writeHeader(const std::string& model, size_t flight_count);
    void writeFlightDetails(const std::vector<Flight>& flights);
    void writeSampleTable(const std::vector<Flight>& flights, const EncounterMonitor& monitor);
    void writeSeparationAnalysis(const EncounterSummary& summary);
    void writeSummary(const EncounterSummary& summary);

    // One line per flight, for live playback
    void writeFrame(size_t encounter, double t, const std::vector<Flight>& flights);

    void writeContainment(const std::string& model, int trials, double fraction);

    void setUseColor(bool use_color) { use_color_ = use_color; }

    static std::string formatPosition(const Vector3& pos);

private:
    const char* getConformanceColor(ConformanceLevel level) const;
    const char* resetColor() const;

    std::ostream& out_;
    bool use_color_;

    static constexpr int COLUMN_WIDTH = 12;
    static constexpr int PRECISION = 3;
    static constexpr size_t RULE_WIDTH = 80;
};

} // namespace encgen

#endif // ENCGEN_ENCOUNTER_REPORT_H
