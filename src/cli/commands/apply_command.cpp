#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <loregraph/cli/command.h>
#include <loregraph/cli/loregraph_cli.h>
#include <loregraph/config/config_helpers.h>
#include <loregraph/core/types.h>

namespace loregraph::cli {

namespace {
// Accepts a bare array of rows or a batch object with a "rows" array.
Result<std::vector<graph::SemanticRelationDraftRow>> parseRows(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::ParseError, "Rows file is not valid JSON"};
    }
    if (parsed.is_object() && parsed.contains("rows")) {
        parsed = parsed["rows"];
    }
    if (!parsed.is_array()) {
        return Error{ErrorCode::InvalidData, "Expected a JSON array of rows"};
    }

    std::vector<graph::SemanticRelationDraftRow> rows;
    rows.reserve(parsed.size());
    for (const auto& item : parsed) {
        if (!item.is_object()) {
            return Error{ErrorCode::InvalidData, "Every row must be a JSON object"};
        }
        rows.push_back(item.get<graph::SemanticRelationDraftRow>());
    }
    return rows;
}
} // namespace

class ApplyCommand : public ICommand {
public:
    std::string getName() const override { return "apply"; }

    std::string getDescription() const override {
        return "Write an edited draft batch back into note front matter";
    }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("apply", getDescription());
        cmd->add_option("rows", rowsFile_, "JSON file with the edited rows")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        const auto path = config::expand_tilde(rowsFile_);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto rows = parseRows(buffer.str());
        if (!rows) {
            return rows.error();
        }

        const auto result = cli_->batchService().applyEditedBatch(rows.value());

        if (cli_->getJsonOutput()) {
            std::cout << nlohmann::json(result).dump(2) << std::endl;
        } else {
            fmt::print("Updated {} note(s), wrote {} relation(s), skipped {} row(s)\n",
                       result.updatedNotes, result.writtenRelations, result.skippedRows);
            for (const auto& row : result.rowResults) {
                fmt::print("  [{}] {} {} {}{}\n", graph::rowApplyStatusName(row.status),
                           row.notePath, row.predicate, row.targetPath,
                           row.reason ? " - " + *row.reason : std::string{});
            }
            for (const auto& error : result.errors) {
                fmt::print("  error: {}\n", error);
            }
        }

        if (!result.errors.empty()) {
            return Error{ErrorCode::WriteError,
                         std::to_string(result.errors.size()) + " note(s) could not be updated"};
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string rowsFile_;
};

std::unique_ptr<ICommand> createApplyCommand() {
    return std::make_unique<ApplyCommand>();
}

} // namespace loregraph::cli
