#include <rangedb/client/remote_database.h>
#include <rangedb/tools/command.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace rangedb::tools {

namespace {

std::string renderPlain(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return "NULL";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "1" : "0";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, ByteVector>) {
                std::string out = "x'";
                for (auto b : v) {
                    out += fmt::format("{:02x}", std::to_integer<unsigned>(b));
                }
                return out + "'";
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

} // namespace

class QueryCommand : public Command {
public:
    explicit QueryCommand(const GlobalOptions& globals)
        : Command("query", "Run a read-only SQL statement against a remote database", globals) {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        addConnectionOptions(*cmd);
        cmd->add_option("-p,--param", params_,
                        "Positional parameter (null, true/false, integer, real, else text)");
        cmd->add_flag("--json", json_, "Print rows as a JSON array of objects");
        cmd->add_option("sql", sql_, "SQL statement")->required();
        cmd->callback([this]() { shouldExecute_ = true; });
    }

    int execute() override {
        if (!shouldExecute_)
            return 0;

        auto cfg = buildConfig();
        if (!cfg) {
            return fail(cfg.error());
        }

        client::RemoteDatabase db;
        if (globals().progress) {
            db.subscribeProgress([](const progress::ProgressEvent& event) {
                std::cerr << fmt::format("\r{}: {:5.1f}% {}/{} bytes {:.0f} B/s", event.operation,
                                         event.percent, event.bytesLoaded, event.bytesTotal,
                                         event.speedBytesPerSec)
                          << std::flush;
            });
        }

        auto connected = db.acquireConnection(cfg.value());
        if (globals().progress) {
            std::cerr << std::endl;
        }
        if (!connected) {
            return fail(connected.error());
        }

        std::vector<Value> values;
        values.reserve(params_.size());
        for (const auto& p : params_) {
            values.push_back(parseLiteral(p));
        }
        auto result = db.runQuery(sql_, std::move(values));
        if (!result) {
            return fail(result.error());
        }

        const auto& rows = result.value();
        if (json_) {
            std::cout << rows.toJson().dump(2) << std::endl;
            return 0;
        }
        std::cout << fmt::format("{}", fmt::join(rows.columns, "\t")) << "\n";
        for (const auto& row : rows.rows) {
            std::vector<std::string> cells;
            cells.reserve(row.size());
            for (const auto& value : row) {
                cells.push_back(renderPlain(value));
            }
            std::cout << fmt::format("{}", fmt::join(cells, "\t")) << "\n";
        }
        std::cout.flush();
        return 0;
    }

private:
    std::vector<std::string> params_;
    std::string sql_;
    bool json_ = false;
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createQueryCommand(const GlobalOptions& globals) {
    return std::make_unique<QueryCommand>(globals);
}

} // namespace rangedb::tools
