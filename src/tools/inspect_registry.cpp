// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license
// Registry database inspection tool for debugging

#include <core/registryparams.h>
#include <db/seed_db.h>
#include <registry/registry_state.h>
#include <util/config.h>
#include <util/logging.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [-conf=<file>] <database_path> [seed_id]" << std::endl;
    std::cerr << "  Without seed_id: registry summary and one line per record" << std::endl;
    std::cerr << "  With seed_id:    full record including the code" << std::endl;
    std::cerr << "  -conf defaults to " << GetConfigFilePath() << std::endl;
}

/** loglevel / logfile from seedline.conf */
static bool ApplyLoggingConfig(const CConfigParser& config, std::string& error) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();

    std::string level_name = config.GetString("loglevel", "info");
    LogLevel level;
    if (!LogLevelFromString(level_name, level)) {
        error = "unknown loglevel '" + level_name + "'";
        return false;
    }
    logging.SetLogLevel(level);

    std::string log_file = config.GetString("logfile");
    if (!log_file.empty()) {
        logging.SetLogFile(log_file);
    }

    // Keep stdout for the report
    logging.SetConsoleLogging(false);
    return true;
}

int main(int argc, char* argv[]) {
    std::string conf_path = GetConfigFilePath();
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.compare(0, 6, "-conf=") == 0) {
            conf_path = arg.substr(6);
        } else if (arg == "-h" || arg == "-help" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1 && positional.size() != 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::string db_path = positional[0];

    SeedId nSelected = NULL_SEED_ID;
    if (positional.size() == 2) {
        const char* text = positional[1].c_str();
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(text, &end, 10);
        if (end == text || *end != '\0' || parsed == 0) {
            std::cerr << "Invalid seed id: " << positional[1] << std::endl;
            return 1;
        }
        nSelected = static_cast<SeedId>(parsed);
    }

    CConfigParser config;
    if (!config.LoadConfigFile(conf_path)) {
        std::cerr << "Failed to read config file: " << conf_path << std::endl;
        return 1;
    }

    std::string error;
    if (!ApplyLoggingConfig(config, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (!CLogger::GetInstance().Initialize(GetDefaultDataDir())) {
        std::cerr << "Warning: file logging unavailable" << std::endl;
    }

    Seedline::RegistryParams params;
    if (!Seedline::RegistryParams::FromConfig(config, params, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    std::cout << "======================================" << std::endl;
    std::cout << "Seedline Registry Inspector" << std::endl;
    std::cout << "======================================" << std::endl;
    std::cout << "Database: " << db_path << std::endl << std::endl;

    CSeedDB db;
    if (!db.Open(db_path, false)) {
        std::cerr << "Failed to open database at: " << db_path << std::endl;
        return 1;
    }

    CRegistryState state;
    if (!db.ReadState(state, error)) {
        std::cerr << "Failed to read registry state: " << error << std::endl;
        return 1;
    }

    if (!state.fInitialized) {
        std::cout << "[WARNING] Registry not initialized" << std::endl;
        return 0;
    }

    if (nSelected != NULL_SEED_ID) {
        const CSeed* seed = state.Find(nSelected);
        if (!seed) {
            std::cerr << "No record with id " << nSelected << std::endl;
            return 1;
        }
        std::cout << seed->ToString() << std::endl;
        std::cout << "  Breeding fee: " << seed->nBreedingFee << std::endl;
        std::cout << "  Unsigned mutation: " << (seed->fAllowUnsignedMutation ? "allowed" : "denied") << std::endl;
        std::cout << "  Code: " << (seed->HasCode() ? seed->code.ToHex() : "(pending)") << std::endl;
        return 0;
    }

    std::cout << "Params: " << params.GetProfileName() << ", " << params.codeLength
              << "-element codes, " << params.founderSlots << " founder slots" << std::endl;
    if (state.nFounderSlots != params.founderSlots) {
        std::cout << "[WARNING] Stored founder slots (" << state.nFounderSlots
                  << ") do not match configuration" << std::endl;
    }
    std::cout << "Authority: " << AccountToHex(state.authority) << std::endl;
    if (state.fSuccessionPending) {
        std::cout << "  Succession pending, previous: " << AccountToHex(state.previousAuthority) << std::endl;
    }
    std::cout << "Accrued balance: " << state.nAccruedBalance << std::endl;
    std::cout << "Founder slots: " << state.nFounderSlots << std::endl;
    std::cout << "Founding era: " << (state.fFoundingEraComplete ? "complete" : "open") << std::endl;
    std::cout << "Ownership gate: " << (state.fGateOpen ? "open" : "closed") << std::endl;
    std::cout << "Minting: " << (state.fMintingOpen ? "open" : "closed") << std::endl;
    std::cout << "Generator: " << (state.fGeneratorInstalled ? "installed" : "none") << std::endl;
    std::cout << "Last id: " << state.nLastId << std::endl;
    std::cout << "Last marker: " << state.nLastMarker << std::endl;
    std::cout << "Reserved fingerprints: " << state.hashIndex.Size() << std::endl;
    std::cout << std::endl;

    size_t nPending = 0;
    for (const auto& entry : state.mapSeeds) {
        const CSeed& seed = entry.second;
        if (!seed.HasCode()) {
            nPending++;
            continue;
        }
        std::cout << "  " << seed.ToString() << std::endl;
    }
    if (nPending > 0) {
        std::cout << "  (" << nPending << " pending founder slots)" << std::endl;
    }

    std::cout << std::endl;
    std::cout << "======================================" << std::endl;

    return 0;
}
