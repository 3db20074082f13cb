#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <string>
#include <vector>

#include "career_ledger.h"
#include "contest_definition.h"
#include "contest_stage.h"
#include "news.h"
#include "qualification.h"
#include "roster_generator.h"
#include "season_session.h"
#include "simulation_context.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/sim_config.toml";
    int students = -1; // -1 means "use season.defaultRosterSize"
    ProvinceTier province = ProvinceTier::Normal;
    std::string outDir;
    int practiceEvery = 0; // 0 disables practice weeks
    bool debugQualification = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "oicoach_cli")
              << " [--seed N] [--config path] [--students N]\n"
              << "       [--province weak|normal|strong] [--outDir path]\n"
              << "       [--practiceEvery N] [--debugQualification 0|1]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--students") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.students)) return false;
        } else if (arg.rfind("--students=", 0) == 0) {
            if (!parseInt(arg.substr(11), opt.students)) return false;
        } else if (arg == "--province") {
            std::string v;
            if (!requireValue(v) || !parseProvinceTier(v, opt.province)) return false;
        } else if (arg.rfind("--province=", 0) == 0) {
            if (!parseProvinceTier(arg.substr(11), opt.province)) return false;
        } else if (arg == "--outDir") {
            if (!requireValue(opt.outDir)) return false;
        } else if (arg.rfind("--outDir=", 0) == 0) {
            opt.outDir = arg.substr(9);
        } else if (arg == "--practiceEvery") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.practiceEvery)) return false;
        } else if (arg.rfind("--practiceEvery=", 0) == 0) {
            if (!parseInt(arg.substr(16), opt.practiceEvery)) return false;
        } else if (arg == "--debugQualification") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.debugQualification)) return false;
        } else if (arg.rfind("--debugQualification=", 0) == 0) {
            if (!parseBool01(arg.substr(21), opt.debugQualification)) return false;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

struct ScheduledStage {
    int week = 0;
    ContestStage stage = ContestStage::Stage1;
};

// Both half-seasons run the full chain at the configured offsets.
std::vector<ScheduledStage> buildSchedule(const SimulationConfig& config) {
    std::vector<ScheduledStage> schedule;
    const int weeksPerHalf = config.resolvedWeeksPerHalf();
    for (int half = 0; half < QualificationLedger::kHalfSeasons; ++half) {
        for (int i = 0; i < kStageCount; ++i) {
            ScheduledStage s;
            s.week = config.season.stageWeeks[static_cast<size_t>(i)] + half * weeksPerHalf;
            s.stage = stageFromIndex(i);
            if (s.week <= config.season.seasonWeeks) {
                schedule.push_back(s);
            }
        }
    }
    return schedule;
}

const ScheduledStage* findStageForWeek(const std::vector<ScheduledStage>& schedule, int week) {
    for (const ScheduledStage& s : schedule) {
        if (s.week == week) return &s;
    }
    return nullptr;
}

// Practice aims at the next stage on the calendar.
ContestDefinition practiceForWeek(const SimulationConfig& config, const std::vector<ScheduledStage>& schedule, int week) {
    ContestStage target = ContestStage::Stage1;
    for (const ScheduledStage& s : schedule) {
        if (s.week > week) {
            target = s.stage;
            break;
        }
    }
    PracticeTier tier = PracticeTier::Easy;
    switch (target) {
        case ContestStage::Stage1: tier = PracticeTier::Easy; break;
        case ContestStage::Stage2: tier = PracticeTier::Medium; break;
        case ContestStage::Stage3: tier = PracticeTier::Hard; break;
        case ContestStage::Stage4:
        case ContestStage::Stage5: tier = PracticeTier::Hell; break;
    }
    const SimulationConfig::StageTuning& tuning = config.stage(target);
    return makePracticeContest(config, tier, tuning.difficulty, std::max(1, tuning.problemCount), false);
}

void printSummary(const SeasonSession& session) {
    std::cout << "\n== Season summary ==\n";
    std::cout << "Province: " << provinceTierName(session.getProvince())
              << "  budget: " << session.getBudget()
              << "  contests recorded: " << session.getCareerLedger().size() << "\n";
    if (session.isEndingTriggered()) {
        std::cout << "Ending: " << session.getEndingReason() << "\n";
    }
    std::cout << std::fixed << std::setprecision(1);
    for (const Competitor& c : session.getRoster()) {
        std::cout << "  " << std::left << std::setw(18) << c.getName() << std::right
                  << " thinking " << std::setw(5) << c.getThinking()
                  << " coding " << std::setw(5) << c.getCoding()
                  << " mental " << std::setw(5) << c.getMental()
                  << " pressure " << std::setw(5) << c.getPressure()
                  << " knowledge";
        for (KnowledgeTag tag : allKnowledgeTags()) {
            std::cout << " " << knowledgeTagName(tag) << "=" << c.getKnowledge(tag);
        }
        std::cout << "\n";
    }
    std::cout << "Recent news:\n" << session.getNews().format();
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }
    if (opt.practiceEvery < 0) {
        std::cerr << "Invalid --practiceEvery=" << opt.practiceEvery << " (expected >= 0)\n";
        return 2;
    }

    QualificationLedger::setDebugMode(opt.debugQualification);

    SimulationContext ctx(opt.seed, opt.configPath);
    const int rosterSize = (opt.students < 0) ? ctx.config.season.defaultRosterSize : opt.students;
    if (rosterSize <= 0) {
        std::cerr << "Invalid --students=" << opt.students << " (expected > 0)\n";
        return 2;
    }

    if (opt.outDir.empty()) {
        std::ostringstream oss;
        oss << "out/cli_runs/seed_" << opt.seed;
        opt.outDir = oss.str();
    }
    std::error_code ec;
    std::filesystem::create_directories(opt.outDir, ec);
    if (ec) {
        std::cerr << "Could not create output directory " << opt.outDir << ": " << ec.message() << "\n";
        return 1;
    }

    RosterGenerator generator(ctx);
    SeasonSession session(ctx, generator.generate(opt.province, rosterSize), opt.province);

    std::cout << "Seed " << opt.seed << ", config hash " << ctx.configHash
              << ", " << rosterSize << " competitor(s), " << provinceTierName(opt.province) << " province\n";

    const std::vector<ScheduledStage> schedule = buildSchedule(ctx.config);
    for (int week = 1; week <= ctx.config.season.seasonWeeks; ++week) {
        session.setWeek(week);
        if (const ScheduledStage* scheduled = findStageForWeek(schedule, week)) {
            ContestResolution resolution;
            std::string error;
            const ContestDefinition def = makeStageContest(ctx.config, scheduled->stage, week);
            if (!session.resolveContest(def, resolution, &error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            std::cout << "W" << week << " " << def.name << ": " << resolutionStatusName(resolution.status);
            if (resolution.status == ResolutionStatus::Resolved) {
                std::cout << " (" << resolution.careerEntry.passedCount << "/" << resolution.careerEntry.participantCount
                          << " passed, line " << static_cast<int>(resolution.passLine) << ")";
            }
            std::cout << "\n";
            if (session.isEndingTriggered()) {
                break;
            }
        } else if (opt.practiceEvery > 0 && week % opt.practiceEvery == 0) {
            PracticeResolution practice;
            std::string error;
            if (!session.runPracticeContest(practiceForWeek(ctx.config, schedule, week), practice, &error)) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
        }
    }

    const std::filesystem::path csvPath = std::filesystem::path(opt.outDir) / "career.csv";
    std::string writeError;
    if (!session.getCareerLedger().writeCsv(csvPath.string(), &writeError)) {
        std::cerr << "Error: " << writeError << "\n";
        return 1;
    }

    printSummary(session);
    std::cout << "Wrote " << csvPath.string() << "\n";
    return 0;
}
