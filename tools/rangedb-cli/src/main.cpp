#include <rangedb/tools/command.h>
#include <rangedb/version.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <map>
#include <memory>

namespace rangedb::tools {

class RangedbCli {
public:
    RangedbCli() : app_("rangedb-cli", "Query SQLite databases over HTTP range requests") {
        setupApp();
        registerCommand(createQueryCommand(globals_));
        registerCommand(createInfoCommand(globals_));
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        spdlog::set_level(effectiveLogLevel(globals_));

        try {
            for (auto& [name, cmd] : commands_) {
                if (app_.got_subcommand(name)) {
                    return cmd->execute();
                }
            }
            std::cout << app_.help() << std::endl;
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", RANGEDB_VERSION_LONG_STRING);
        app_.require_subcommand(0, 1);

        addGlobalOptions(app_, globals_);
    }

    void registerCommand(std::unique_ptr<Command> cmd) {
        const std::string& name = cmd->getName();
        cmd->setupOptions(app_);
        commands_[name] = std::move(cmd);
    }

    CLI::App app_;
    GlobalOptions globals_;
    std::map<std::string, std::unique_ptr<Command>> commands_;
};

} // namespace rangedb::tools

int main(int argc, char** argv) {
    // Logs go to stderr so query output on stdout stays parseable.
    spdlog::set_default_logger(spdlog::stderr_color_mt("rangedb"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    rangedb::tools::RangedbCli app;
    return app.run(argc, argv);
}
