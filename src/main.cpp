#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tool/header_tool.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace jaegerprop;

int main(int argc, char* argv[]) {
    try {
        std::string config_file;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    utils::log::error("--config requires a file path");
                    std::cerr << HeaderTool::usage();
                    return HeaderTool::kExitUsage;
                }
                config_file = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                std::cout << HeaderTool::usage();
                return HeaderTool::kExitOk;
            } else {
                args.push_back(arg);
            }
        }

        ToolConfig config;
        if (!config_file.empty()) {
            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return HeaderTool::kExitUsage;
            }
            config = std::move(config_result.config);
        }
        utils::log::set_level(config.logging.level);

        if (!config_file.empty()) {
            utils::log::info(std::format("Loaded configuration from {} (output={}, fail_fast={})",
                config_file, output_format_to_string(config.output.format),
                utils::booltostr(config.decode.fail_fast)));
        }

        const HeaderTool tool(std::move(config));
        const int exit_code = tool.run(args, std::cin, std::cout);
        if (exit_code == HeaderTool::kExitUsage) {
            std::cerr << HeaderTool::usage();
        }
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
