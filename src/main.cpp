#include "core/conversion_pipeline.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace mysql2pg;

static void print_usage(const char* prog) {
    std::cerr << std::format("Usage: {} [config.toml]\n", prog)
              << "  Converts a MySQL dump into a PostgreSQL schema file and\n"
              << "  size-bounded INSERT chunks, optionally loading them in parallel.\n"
              << "  Defaults to config/mysql2pg.toml.\n";
}

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/mysql2pg.toml";
        if (argc > 2) {
            print_usage(argv[0]);
            return 1;
        }
        if (argc > 1) {
            const std::string arg = argv[1];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
            config_file = arg;
        }

        utils::log::info(std::format("mysql2pg starting, configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }

        const auto level = utils::log::parse_level(config_result.config.logging.level);
        if (level) {
            utils::log::set_level(*level);
        }

        ConversionPipeline pipeline(std::move(config_result.config));
        const auto report = pipeline.run();
        return report.success() ? 0 : 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
