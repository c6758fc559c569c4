#include "cli/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include "infrastructure/error_handling.h"
#include <nlohmann/json.hpp>
#include <getopt.h>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace sciencefund {

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help            Show this help\n";
    std::cout << "  -v, --version         Show version\n";
    std::cout << "  -D, --datadir DIR     Data directory\n";
    std::cout << "  -c, --config FILE     Config file (default DATADIR/sciencefund.conf)\n";
    std::cout << "  -u, --caller ID       Principal issuing the command\n";
    std::cout << "  -l, --loglevel LEVEL  Log level (debug/info/warn/error/off)\n\n";
    std::cout << "Commands:\n";
    std::cout << "  register NAME INSTITUTION [TAG,TAG...]\n";
    std::cout << "  create-project TITLE DESCRIPTION AREA GOAL DAYS [MILESTONE_TEXT...]\n";
    std::cout << "  fund PROJECT AMOUNT\n";
    std::cout << "  create-milestone PROJECT DESCRIPTION AMOUNT\n";
    std::cout << "  complete MILESTONE EVIDENCE\n";
    std::cout << "  verify MILESTONE\n";
    std::cout << "  set-verifier PRINCIPAL on|off\n";
    std::cout << "  set-fee BPS\n";
    std::cout << "  set-fee-recipient PRINCIPAL\n";
    std::cout << "  withdraw-all\n";
    std::cout << "  project ID\n";
    std::cout << "  contributors ID\n";
    std::cout << "  contribution ID PRINCIPAL\n";
    std::cout << "  researcher PRINCIPAL\n";
    std::cout << "  milestone ID\n";
    std::cout << "  totals\n";
    std::cout << "  balance [PRINCIPAL]\n";
}

void printVersion() {
    std::cout << "ScienceFund ledger v0.1.0\n";
    std::cout << "Schema version: " << core::LedgerStore::SCHEMA_VERSION << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    optind = 0;
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"datadir", required_argument, nullptr, 'D'},
        {"config", required_argument, nullptr, 'c'},
        {"caller", required_argument, nullptr, 'u'},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "+hvD:c:u:l:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'D':
                config.dataDir = optarg;
                break;
            case 'c':
                config.configPath = optarg;
                break;
            case 'u':
                config.caller = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.commandArgs.push_back(argv[i]);
    }
    return true;
}

// Stored strings are opaque bytes; invalid UTF-8 is printed as U+FFFD.
static std::string render(const json& value) {
    return value.dump(2, ' ', false, json::error_handler_t::replace);
}

static json projectToJson(const core::Project& p) {
    json out;
    out["id"] = p.id;
    out["researcher"] = p.researcher;
    out["title"] = p.title;
    out["description"] = p.description;
    out["research_area"] = p.researchArea;
    out["funding_goal"] = p.fundingGoal;
    out["current_funding"] = p.currentFunding();
    out["deadline"] = utils::Formatter::formatTimestamp(p.deadline);
    out["created_at"] = utils::Formatter::formatTimestamp(p.createdAt);
    out["status"] = core::projectStatusName(p.status);
    out["milestone_plan"] = p.milestoneTexts;
    out["contributors"] = p.contributors().size();
    return out;
}

static json researcherToJson(const core::Researcher& r) {
    json out;
    out["id"] = r.id;
    out["name"] = r.name;
    out["institution"] = r.institution;
    out["expertise"] = r.expertise;
    out["reputation"] = r.reputation;
    out["verified"] = r.verified;
    out["projects"] = r.projects;
    return out;
}

static json milestoneToJson(const core::Milestone& m) {
    json out;
    out["id"] = m.id;
    out["project_id"] = m.projectId;
    out["description"] = m.description;
    out["funding_amount"] = m.fundingAmount;
    out["completed"] = m.completed;
    out["verified"] = m.verified;
    if (m.completed) {
        out["completed_at"] = utils::Formatter::formatTimestamp(m.completedAt);
        out["evidence"] = m.evidence;
    }
    return out;
}

static int reportFailure(const Error& error) {
    std::cerr << "Error: " << errorToString(error.code) << ": " << error.message << "\n";
    return EXIT_LEDGER;
}

static bool needArgs(const std::vector<std::string>& args, size_t count) {
    if (args.size() >= count) return true;
    std::cerr << "Missing arguments for " << args[0] << " (see --help)\n";
    return false;
}

static bool parseNumber(const std::string& text, uint64_t& out) {
    if (utils::Formatter::parseUint64(text, out)) return true;
    std::cerr << "Not a number: " << text << "\n";
    return false;
}

int runCommand(core::FundingLedger& ledger, const CliConfig& config) {
    const auto& args = config.commandArgs;
    const std::string& cmd = args[0];
    const std::string& caller = config.caller;

    if (cmd == "register") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        std::vector<std::string> tags;
        if (args.size() > 3) tags = utils::Formatter::split(args[3], ',');
        auto r = ledger.registerResearcher(caller, args[1], args[2], tags);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Registered " << caller << "\n";
        return 0;
    }

    if (cmd == "create-project") {
        if (!needArgs(args, 6)) return EXIT_USAGE;
        uint64_t goal = 0, days = 0;
        if (!parseNumber(args[4], goal) || !parseNumber(args[5], days)) return EXIT_USAGE;
        std::vector<std::string> plan(args.begin() + 6, args.end());
        auto r = ledger.createProject(caller, args[1], args[2], args[3], goal, days, plan);
        if (r.failed()) return reportFailure(r.error());
        json out;
        out["project_id"] = r.value();
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "fund") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        uint64_t id = 0, amount = 0;
        if (!parseNumber(args[1], id) || !parseNumber(args[2], amount)) return EXIT_USAGE;
        auto r = ledger.fundProject(caller, id, amount);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Funded project " << id << " with " << utils::Formatter::formatAmount(amount) << "\n";
        return 0;
    }

    if (cmd == "create-milestone") {
        if (!needArgs(args, 4)) return EXIT_USAGE;
        uint64_t id = 0, amount = 0;
        if (!parseNumber(args[1], id) || !parseNumber(args[3], amount)) return EXIT_USAGE;
        auto r = ledger.createMilestone(caller, id, args[2], amount);
        if (r.failed()) return reportFailure(r.error());
        json out;
        out["milestone_id"] = r.value();
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "complete") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.completeMilestone(caller, id, args[2]);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Milestone " << id << " completed\n";
        return 0;
    }

    if (cmd == "verify") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.verifyMilestone(caller, id);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Milestone " << id << " verified and paid out\n";
        return 0;
    }

    if (cmd == "set-verifier") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        if (args[2] != "on" && args[2] != "off") {
            std::cerr << "Expected on or off, got " << args[2] << "\n";
            return EXIT_USAGE;
        }
        auto r = ledger.setVerifier(caller, args[1], args[2] == "on");
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Verifier " << args[1] << " " << args[2] << "\n";
        return 0;
    }

    if (cmd == "set-fee") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        uint64_t bps = 0;
        if (!parseNumber(args[1], bps)) return EXIT_USAGE;
        auto r = ledger.setPlatformFee(caller, bps);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Platform fee set to " << utils::Formatter::formatBps(bps) << "\n";
        return 0;
    }

    if (cmd == "set-fee-recipient") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        auto r = ledger.setFeeRecipient(caller, args[1]);
        if (r.failed()) return reportFailure(r.error());
        std::cout << "Fee recipient set to " << args[1] << "\n";
        return 0;
    }

    if (cmd == "withdraw-all") {
        auto r = ledger.emergencyWithdraw(caller);
        if (r.failed()) return reportFailure(r.error());
        json out;
        out["withdrawn"] = r.value();
        out["recipient"] = caller;
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "project") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.getProject(id);
        if (r.failed()) return reportFailure(r.error());
        json out = projectToJson(r.value());
        auto milestones = ledger.getProjectMilestones(id);
        if (milestones.ok()) out["milestones"] = milestones.value();
        auto allocated = ledger.getMilestoneAllocation(id);
        if (allocated.ok()) out["milestone_allocation"] = allocated.value();
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "contributors") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.getProjectContributors(id);
        if (r.failed()) return reportFailure(r.error());
        json out = json::array();
        for (const auto& c : r.value()) {
            json entry;
            entry["contributor"] = c;
            entry["amount"] = ledger.getContribution(id, c).valueOr(0);
            out.push_back(entry);
        }
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "contribution") {
        if (!needArgs(args, 3)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.getContribution(id, args[2]);
        if (r.failed()) return reportFailure(r.error());
        json out;
        out["project_id"] = id;
        out["contributor"] = args[2];
        out["amount"] = r.value();
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "researcher") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        auto r = ledger.getResearcher(args[1]);
        if (r.failed()) return reportFailure(r.error());
        std::cout << render(researcherToJson(r.value())) << "\n";
        return 0;
    }

    if (cmd == "milestone") {
        if (!needArgs(args, 2)) return EXIT_USAGE;
        uint64_t id = 0;
        if (!parseNumber(args[1], id)) return EXIT_USAGE;
        auto r = ledger.getMilestone(id);
        if (r.failed()) return reportFailure(r.error());
        std::cout << render(milestoneToJson(r.value())) << "\n";
        return 0;
    }

    if (cmd == "totals") {
        json out;
        out["projects"] = ledger.getTotalProjects();
        out["milestones"] = ledger.getTotalMilestones();
        out["pool"] = ledger.getPoolBalance();
        out["fee_bps"] = ledger.getPlatformFee();
        out["fee_recipient"] = ledger.getFeeRecipient();
        out["owner"] = ledger.getOwner();
        std::cout << render(out) << "\n";
        return 0;
    }

    if (cmd == "balance") {
        std::string who = args.size() > 1 ? args[1] : caller;
        json out;
        out["principal"] = who;
        out["balance"] = ledger.getBalance(who);
        out["verifier"] = ledger.isVerifier(who);
        std::cout << render(out) << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return EXIT_USAGE;
}

int runCli(int argc, char* argv[]) {
    CliConfig config;

    if (!parseArgs(argc, argv, config)) {
        return EXIT_USAGE;
    }
    if (config.showHelp) {
        printHelp(argv[0]);
        return 0;
    }
    if (config.showVersion) {
        printVersion();
        return 0;
    }
    if (config.commandArgs.empty()) {
        printHelp(argv[0]);
        return EXIT_USAGE;
    }

    auto& settings = utils::Config::instance();
    if (!config.dataDir.empty()) settings.setDataDir(config.dataDir);
    std::string dataDir = settings.getDataDir();

    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Cannot create data directory " << dataDir << ": " << ec.message() << "\n";
        return EXIT_USAGE;
    }

    std::string configPath = config.configPath.empty() ? dataDir + "/sciencefund.conf" : config.configPath;
    if (!settings.load(configPath) && !config.configPath.empty()) {
        std::cerr << "Cannot read config file " << configPath << "\n";
        return EXIT_USAGE;
    }

    auto ledgerConfig = settings.getLedgerConfig();
    utils::LogSettings logSettings;
    std::string level = config.logLevel.empty() ? ledgerConfig.logLevel : config.logLevel;
    if (!utils::Logger::parseLevel(level, logSettings.level)) {
        std::cerr << "Unknown log level: " << level << "\n";
        return EXIT_USAGE;
    }
    logSettings.path = ledgerConfig.logPath();
    logSettings.console = ledgerConfig.logConsole;
    logSettings.maxFileSize = ledgerConfig.logMaxSize;
    logSettings.maxFiles = ledgerConfig.logMaxFiles;
    if (!utils::Logger::init(logSettings)) {
        std::cerr << "Cannot open log file " << logSettings.path << "\n";
    }

    if (config.caller.empty()) config.caller = settings.getString("cli.caller");

    auto platform = settings.getPlatformConfig();
    core::PlatformParams params;
    params.owner = platform.owner;
    params.feeBps = platform.feeBps;
    params.feeRecipient = platform.feeRecipient;
    params.verifiers = platform.verifiers;

    core::FundingLedger ledger;
    auto opened = ledger.open(ledgerConfig.dbPath(), params);
    if (opened.failed()) {
        std::cerr << "Cannot open ledger: " << describe(opened.error()) << "\n";
        utils::Logger::shutdown();
        return EXIT_LEDGER;
    }

    int rc = runCommand(ledger, config);
    ledger.close();
    utils::Logger::shutdown();
    return rc;
}

}
