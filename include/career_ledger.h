#pragma once

#include <string>
#include <vector>

#include "contest_stage.h"

struct CareerOutcome {
    std::string name;
    bool participated = false;
    int rank = 0;   // 0 when not participating
    int score = -1; // -1 when not participating
    bool passed = false;
    MedalTier medal = MedalTier::None;
    std::string remark;
};

struct CareerEntry {
    int week = 0;
    std::string contestName;
    ContestStage stage = ContestStage::Stage1;
    int halfSeason = 0;
    int passedCount = 0;
    int participantCount = 0;
    std::vector<CareerOutcome> outcomes; // participants by rank, then non-participants
};

// Append-only record of every resolved contest occurrence.
class CareerLedger {
public:
    void append(const CareerEntry& entry) { m_entries.push_back(entry); }
    const std::vector<CareerEntry>& getEntries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }

    // One row per outcome. Returns false when the file cannot be written.
    bool writeCsv(const std::string& path, std::string* errorMessage = nullptr) const;

private:
    std::vector<CareerEntry> m_entries;
};
