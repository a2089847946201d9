#include <rangedb/metadata/metadata_resolver.h>
#include <rangedb/tools/command.h>
#include <rangedb/transport/range_adapter.h>
#include <rangedb/transport/retrier.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>

namespace rangedb::tools {

class InfoCommand : public Command {
public:
    explicit InfoCommand(const GlobalOptions& globals)
        : Command("info", "Resolve and print the suffix descriptor of a database", globals) {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand(getName(), getDescription());
        addConnectionOptions(*cmd);
        cmd->callback([this]() { shouldExecute_ = true; });
    }

    int execute() override {
        if (!shouldExecute_)
            return 0;

        auto cfg = buildConfig();
        if (!cfg) {
            return fail(cfg.error());
        }
        const auto& config = cfg.value();

        std::shared_ptr<transport::IRangeAdapter> adapter =
            transport::makeRangeAdapter(config.source);
        auto retrier = std::make_shared<transport::TransportRetrier>(config.timeouts, config.retry);
        metadata::MetadataResolver resolver(adapter, retrier, config.fetchOptions());

        auto descriptor = resolver.resolveDescriptor(config.effectiveSuffixUrl(), config.url);
        if (!descriptor) {
            return fail(descriptor.error());
        }

        nlohmann::json out;
        out["descriptor"] = config.effectiveSuffixUrl();
        out["identity"] = metadata::identityToJson(descriptor.value().identity);
        out["chunkEntries"] = descriptor.value().chunks.size();
        out["metadata"] = descriptor.value().metadata;
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

private:
    bool shouldExecute_ = false;
};

std::unique_ptr<Command> createInfoCommand(const GlobalOptions& globals) {
    return std::make_unique<InfoCommand>(globals);
}

} // namespace rangedb::tools
