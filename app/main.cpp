#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "layers/application/CancellationToken.h"
#include "layers/application/application_layer.h"
#include "layers/application/errors.h"
#include "layers/config/config_layer.h"
#include "layers/logging/logging_layer.h"

namespace {

struct StartupOptions {
    std::string configPath;
    bool checkOnly = false;
    bool verbose = false;
    bool showHelp = false;
};

application::CancellationToken g_stopToken;

extern "C" void onStopSignal(int) {
    g_stopToken.requestStop();
}

void printUsage() {
    std::cout
        << "Usage: modbus_logger [options] <config.json>\n"
        << "Options:\n"
        << "  --config <path>                Configuration file (alternative to the positional argument)\n"
        << "  --check-config                 Validate the configuration and exit\n"
        << "  --verbose                      Log raw register blocks\n"
        << "  --help                         Show this help\n"
        << "\n"
        << "Exit codes: 0 stopped, 1 configuration error, 2 usage error,\n"
        << "            3 connection failure, 4 device escalation, 5 unexpected error\n";
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--check-config") {
            options.checkOnly = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                error = "Missing value for --config";
                return std::nullopt;
            }
            if (!options.configPath.empty()) {
                error = "Configuration file given twice";
                return std::nullopt;
            }
            options.configPath = argv[++i];
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            error = "Unknown argument: " + arg;
            return std::nullopt;
        }
        if (!options.configPath.empty()) {
            error = "Unexpected argument: " + arg;
            return std::nullopt;
        }
        options.configPath = arg;
    }

    if (!options.showHelp && options.configPath.empty()) {
        error = "A configuration file is required";
        return std::nullopt;
    }

    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return application::ExitUsageError;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return application::ExitOk;
    }

    logging::LogSink log(std::cout);
    if (options.verbose) {
        log.setMinimumLevel(logging::Level::Debug);
    }

    return application::runReportingErrors(log, [&]() {
        application::LoggerApplication app(config::loadConfig(options.configPath), log, g_stopToken);
        app.prepare();

        if (options.checkOnly) {
            log.info("Configuration OK: " + options.configPath);
            return static_cast<int>(application::ExitOk);
        }

        const auto& logCfg = app.configuration().logging;
        std::string error;
        const auto logFolder = (std::filesystem::path(logCfg.baseFolder) / "logs").string();
        if (!log.attachFolder(logFolder, logCfg.retentionDays, error)) {
            log.error(error);
            return static_cast<int>(application::ExitConfigError);
        }

        std::signal(SIGINT, onStopSignal);
        std::signal(SIGTERM, onStopSignal);

        log.info("Starting continuous logging... (Press Ctrl+C to stop)");
        return app.run();
    });
}
