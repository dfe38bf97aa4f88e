#include <iostream>
#include <string>
#include <vector>
#include <filesystem>

#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/pacer.hpp"
#include "crypto/fingerprint_oracle.hpp"
#include "pipeline/pipeline_driver.hpp"
#include "storage/local_fragment_store.hpp"

namespace {
    constexpr const char* DEFAULT_CONFIG_FILE = "config.json";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        CLI::print_help();
        return 1;
    }

    std::string mode = argv[1];
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    try {
        Config config;
        if (!config_path.empty()) {
            config = Config::load(config_path);
        } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
            config = Config::load(DEFAULT_CONFIG_FILE);
        }

        // Initialize Logger
        Logger::instance().init(config.log.file);
        Logger::instance().set_level(config.log.level);
        LOG_INFO("Starting fragxfer (", mode, ")");

        MerkleFingerprintOracle oracle;
        LocalFragmentStore store(config.storage.database, oracle, config.storage.capacity_bytes);
        TimerPacer pacer;
        PipelineDriver driver(store, oracle, pacer, PipelineSettings::from_config(config));

        CLI cli(config, driver, store);
        return cli.handle_command(mode, args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
