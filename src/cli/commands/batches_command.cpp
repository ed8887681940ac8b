#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <loregraph/cli/command.h>
#include <loregraph/cli/loregraph_cli.h>
#include <loregraph/config/config_helpers.h>
#include <loregraph/core/types.h>

namespace loregraph::cli {

class BatchesCommand : public ICommand {
public:
    std::string getName() const override { return "batches"; }

    std::string getDescription() const override {
        return "Build reviewable semantic relation draft batches";
    }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("batches", getDescription());
        cmd->add_option("--proposals", proposalsFile_,
                        "Tool output (JSON or text) to harvest relation proposals from");
        cmd->add_option("--tool", toolName_, "Tool name recorded as the proposal source")
            ->default_val("file");
        cmd->add_flag("--no-vault", noVault_, "Skip relations already present in front matter");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        auto& proposals = cli_->proposals();
        if (!proposalsFile_.empty()) {
            const auto path = config::expand_tilde(proposalsFile_);
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
            }
            std::ostringstream buffer;
            buffer << file.rdbuf();

            auto payload = nlohmann::json::parse(buffer.str(), nullptr, false);
            if (payload.is_discarded()) {
                payload = buffer.str();
            }
            const auto accepted = proposals.ingestFromToolOutput(toolName_, payload);
            spdlog::info("Captured {} proposal(s) from {}", accepted, path.string());
        }

        graph::DraftBatchBuildOptions options;
        options.includeVaultDrafts = !noVault_;
        options.proposalAdapters.push_back(graph::makeToolOutputProposalAdapter(proposals));
        const auto batches = cli_->batchService().buildDraftBatches(options);

        if (cli_->getJsonOutput()) {
            std::cout << nlohmann::json(batches).dump(2) << std::endl;
            return Result<void>();
        }

        if (batches.empty()) {
            fmt::print("No semantic relation rows\n");
            return Result<void>();
        }
        for (const auto& batch : batches) {
            fmt::print("{} (rows {}-{} of {})\n", batch.id, batch.startRow, batch.endRow,
                       batch.totalRows);
            for (const auto& row : batch.rows) {
                fmt::print("  {} --{}--> {}  {}%  [{}]\n", row.notePath, row.predicate,
                           row.targetPath, row.confidence,
                           row.proposalSource.value_or(row.sourceField));
            }
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string proposalsFile_;
    std::string toolName_{"file"};
    bool noVault_{false};
};

std::unique_ptr<ICommand> createBatchesCommand() {
    return std::make_unique<BatchesCommand>();
}

} // namespace loregraph::cli
