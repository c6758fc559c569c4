#pragma once

#include "core/funding_ledger.h"
#include <string>
#include <vector>

namespace sciencefund {

struct CliConfig {
    std::string dataDir;
    std::string configPath;
    std::string caller;
    std::string logLevel;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> commandArgs;
};

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_LEDGER = 2;

void printHelp(const char* prog);
void printVersion();
bool parseArgs(int argc, char* argv[], CliConfig& config);

// Executes commandArgs[0] against an open ledger and prints the outcome.
int runCommand(core::FundingLedger& ledger, const CliConfig& config);

// Full tool entry point: options, config file, logging, ledger open, command.
int runCli(int argc, char* argv[]);

}
