#include <csignal>
#include <cstdio>
#include <string>
#include <vector>
#include "cli.h"
#include "config.h"
#include "logger.h"
#include "utils.h"

int main(int argc, char* argv[]) {
    setvbuf(stdout, nullptr, _IOLBF, 0);
    setvbuf(stderr, nullptr, _IOLBF, 0);

    // POSIX: Ignore SIGPIPE, a closed stdout pipe must not end the process mid-write
    signal(SIGPIPE, SIG_IGN);

    // Global options come before the command; everything else goes to the CLI
    std::string config_path = Config::default_path();
    bool no_color = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                utils::safe_print("Error: --config requires a path\n");
                return 1;
            }
            config_path = utils::expand_home(argv[++i]);
        } else if (arg == "--no-color") {
            no_color = true;
        } else {
            args.push_back(arg);
        }
    }

    Config config = Config::load(config_path);
    if (no_color) {
        config.color = false;
    }

    // Ensure log directory and file exist
    if (!config.log_file.empty()) {
        std::string log_file = utils::expand_home(config.log_file);
        if (!utils::ensure_log_file(log_file)) {
            fprintf(stderr, "Warning: Could not create log file: %s\n", log_file.c_str());
        } else {
            Logger::instance().init(log_file);

            LogLevel level = LogLevel::INFO;
            if (Logger::parse_level(config.log_level, level)) {
                Logger::instance().set_level(level);
            } else {
                Logger::instance().log(LogLevel::WARN, "Unknown log_level '" + config.log_level + "', using INFO");
            }
            Logger::instance().log(LogLevel::INFO, "tunnelform starting (config: " + config_path + ")");
        }
    }

    TunnelCLI cli(config, config_path);
    int result = cli.execute(args);

    Logger::instance().log(LogLevel::INFO, "tunnelform exiting with status " + std::to_string(result));
    Logger::instance().close();
    return result;
}
