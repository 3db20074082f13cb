#include "career_ledger.h"

#include <fstream>

namespace {

std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

bool CareerLedger::writeCsv(const std::string& path, std::string* errorMessage) const {
    std::ofstream out(path);
    if (!out) {
        if (errorMessage) *errorMessage = "could not open output file: " + path;
        return false;
    }

    out << "week,half,stage,contest,passed_count,participant_count,name,participated,rank,score,passed,medal,remark\n";
    for (const CareerEntry& e : m_entries) {
        for (const CareerOutcome& o : e.outcomes) {
            out << e.week << ","
                << e.halfSeason << ","
                << stageDefinition(e.stage).key << ","
                << csvField(e.contestName) << ","
                << e.passedCount << ","
                << e.participantCount << ","
                << csvField(o.name) << ","
                << (o.participated ? 1 : 0) << ",";
            if (o.participated) {
                out << o.rank << "," << o.score;
            } else {
                out << ",";
            }
            out << "," << (o.passed ? 1 : 0) << ","
                << medalTierName(o.medal) << ","
                << csvField(o.remark) << "\n";
        }
    }
    if (!out) {
        if (errorMessage) *errorMessage = "write failed: " + path;
        return false;
    }
    return true;
}
