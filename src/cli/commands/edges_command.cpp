#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <loregraph/cli/command.h>
#include <loregraph/cli/loregraph_cli.h>
#include <loregraph/core/types.h>

namespace loregraph::cli {

class EdgesCommand : public ICommand {
public:
    std::string getName() const override { return "edges"; }

    std::string getDescription() const override { return "List the outgoing edges of a note"; }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("edges", getDescription());
        cmd->add_option("path", path_, "Vault-relative note path")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        auto& index = cli_->index();
        index.ensureReady();
        auto node = index.getNode(path_);
        if (!node) {
            return Error{ErrorCode::NotFound, "No entity for " + path_};
        }
        const auto edges = index.getOutgoingEdges(path_);

        if (cli_->getJsonOutput()) {
            nlohmann::json out{{"node", *node}, {"edges", edges}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        fmt::print("{} ({} aliases, {} tags)\n", node->canonicalName, node->aliases.size(),
                   node->tags.size());
        for (const auto& edge : edges) {
            std::string relation = graph::relationTypeName(edge.relation);
            if (edge.semanticPredicate) {
                relation += ":";
                relation += graph::semanticPredicateName(*edge.semanticPredicate);
            }
            fmt::print("  {:<36} -> {}  ({:.2f})\n", relation, edge.toId, edge.confidence);
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string path_;
};

std::unique_ptr<ICommand> createEdgesCommand() {
    return std::make_unique<EdgesCommand>();
}

} // namespace loregraph::cli
