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

class ExpandCommand : public ICommand {
public:
    std::string getName() const override { return "expand"; }

    std::string getDescription() const override {
        return "Expand the graph neighbourhood of the entities named by a query";
    }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("expand", getDescription());
        cmd->add_option("query", query_, "Query text")->required();
        cmd->add_option("--hops", hops_, "Maximum hop depth (0 = configured)")->default_val(0);
        cmd->add_option("--limit", limit_, "Maximum expanded documents (0 = configured)")
            ->default_val(0);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        const auto settings = cli_->settings().get();
        const int hops = hops_ > 0 ? hops_ : settings.entityGraphMaxHops;
        const int limit = limit_ > 0 ? limit_ : settings.entityGraphMaxExpandedDocs;

        auto& index = cli_->index();
        const auto resolved = index.resolveEntities(query_);
        const auto hits = index.expandFromResolvedEntities(resolved, hops, limit);
        spdlog::debug("expand: {} seed(s), {} hit(s)", resolved.size(), hits.size());

        if (cli_->getJsonOutput()) {
            nlohmann::json out{{"resolvedEntities", resolved}, {"hits", hits}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        if (resolved.empty()) {
            fmt::print("No entities matched '{}'\n", query_);
            return Result<void>();
        }
        fmt::print("Seeds:");
        for (const auto& entity : resolved) {
            fmt::print(" {}", entity.canonicalName);
        }
        fmt::print("\n");

        for (const auto& hit : hits) {
            fmt::print("{:>6.3f}  {}  (hop {}, {} evidence)\n", hit.score, hit.path,
                       hit.explanation.hopDepth, hit.explanation.evidenceCount);
            for (const auto& path : hit.explanation.relationPaths) {
                fmt::print("          {}\n", path);
            }
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string query_;
    int hops_{0};
    int limit_{0};
};

std::unique_ptr<ICommand> createExpandCommand() {
    return std::make_unique<ExpandCommand>();
}

} // namespace loregraph::cli
