#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <loregraph/cli/command.h>
#include <loregraph/cli/loregraph_cli.h>
#include <loregraph/core/types.h>

namespace loregraph::cli {

class ResolveCommand : public ICommand {
public:
    std::string getName() const override { return "resolve"; }

    std::string getDescription() const override {
        return "Resolve the entities a free-text query refers to";
    }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("resolve", getDescription());
        cmd->add_option("query", query_, "Query text")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        const auto resolved = cli_->index().resolveEntities(query_);
        if (cli_->getJsonOutput()) {
            std::cout << nlohmann::json(resolved).dump(2) << std::endl;
            return Result<void>();
        }

        if (resolved.empty()) {
            fmt::print("No entities matched '{}'\n", query_);
            return Result<void>();
        }
        for (const auto& entity : resolved) {
            fmt::print("{:>6.2f}  {}  ({})  alias=\"{}\"\n", entity.score, entity.canonicalName,
                       entity.entityId, entity.matchedAlias);
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string query_;
};

std::unique_ptr<ICommand> createResolveCommand() {
    return std::make_unique<ResolveCommand>();
}

} // namespace loregraph::cli
