#pragma once

#include <rangedb/config/database_config.h>
#include <rangedb/core/types.h>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace rangedb::tools {

/**
 * Options registered on the top-level app and shared by every command.
 */
struct GlobalOptions {
    std::string configPath;
    std::string logLevel = "warn";
    bool debug = false;
    bool progress = false;
};

inline void addGlobalOptions(CLI::App& app, GlobalOptions& globals) {
    app.add_option("-c,--config", globals.configPath, "Path to configuration file");
    app.add_option("--log-level", globals.logLevel, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_flag("-d,--debug", globals.debug, "Enable debug logging");
    app.add_flag("--progress", globals.progress, "Print download progress to stderr");
}

// --debug wins over --log-level.
inline spdlog::level::level_enum effectiveLogLevel(const GlobalOptions& globals) {
    if (globals.debug) {
        return spdlog::level::debug;
    }
    return spdlog::level::from_str(globals.logLevel);
}

/**
 * Base class for all CLI commands
 *
 * Commands register a subcommand in setupOptions() and run in execute() only when that
 * subcommand was selected.
 */
class Command {
public:
    Command(std::string name, std::string description, const GlobalOptions& globals)
        : name_(std::move(name)), description_(std::move(description)), globals_(globals) {}

    virtual ~Command() = default;

    virtual void setupOptions(CLI::App& app) = 0;
    virtual int execute() = 0;

    const std::string& getName() const { return name_; }
    const std::string& getDescription() const { return description_; }

protected:
    // Connection options shared by commands that talk to a database
    struct ConnectionOptions {
        std::string url;
        std::string suffixUrl;
        std::string mode;
        std::string source;
        std::uint32_t chunkSize = 0;
    };

    void addConnectionOptions(CLI::App& app) {
        app.add_option("-u,--url", connection_.url, "Database URL or path");
        app.add_option("--suffix-url", connection_.suffixUrl,
                       "Suffix descriptor URL (default: <url>.suffix)");
        app.add_option("-m,--mode", connection_.mode, "Server mode")
            ->check(CLI::IsMember({"partial", "full"}));
        app.add_option("-s,--source", connection_.source, "Database source")
            ->check(CLI::IsMember({"remote", "cdn", "local"}));
        app.add_option("--chunk-size", connection_.chunkSize,
                       "Chunk size in bytes for full mode");
    }

    /**
     * Config file and environment first, then the command line.
     */
    Result<config::DatabaseConfig> buildConfig() const {
        auto resolved = config::resolveDatabaseConfig(globals_.configPath);
        if (!resolved) {
            return resolved.error();
        }
        auto cfg = std::move(resolved).value();
        if (!connection_.url.empty()) {
            cfg.url = connection_.url;
        }
        if (!connection_.suffixUrl.empty()) {
            cfg.suffixUrl = connection_.suffixUrl;
        }
        if (!connection_.mode.empty()) {
            auto mode = config::parseServerMode(connection_.mode);
            if (!mode) {
                return mode.error();
            }
            cfg.serverMode = mode.value();
        }
        if (!connection_.source.empty()) {
            auto source = transport::parseSource(connection_.source);
            if (!source) {
                return source.error();
            }
            cfg.source = source.value();
        }
        if (connection_.chunkSize != 0) {
            cfg.requestChunkSize = connection_.chunkSize;
        }
        if (auto valid = cfg.validate(); !valid) {
            return valid.error();
        }
        return cfg;
    }

    const GlobalOptions& globals() const { return globals_; }

    int fail(const Error& error) const {
        std::cerr << "Error: " << error.describe() << std::endl;
        return 1;
    }

    ConnectionOptions connection_;

private:
    std::string name_;
    std::string description_;
    const GlobalOptions& globals_;
};

std::unique_ptr<Command> createQueryCommand(const GlobalOptions& globals);
std::unique_ptr<Command> createInfoCommand(const GlobalOptions& globals);

} // namespace rangedb::tools
