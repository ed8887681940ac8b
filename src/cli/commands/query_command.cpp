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

namespace {
constexpr std::size_t kPreviewChars = 160;

std::string preview(const std::string& content) {
    std::string out = content.substr(0, kPreviewChars);
    for (auto& c : out) {
        if (c == '\n' || c == '\r' || c == '\t')
            c = ' ';
    }
    if (content.size() > kPreviewChars)
        out += "...";
    return out;
}
} // namespace

class QueryCommand : public ICommand {
public:
    std::string getName() const override { return "query"; }

    std::string getDescription() const override {
        return "Run entity graph retrieval augmentation for a query";
    }

    void registerCommand(CLI::App& app, LoreGraphCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("query", getDescription());
        cmd->add_option("query", query_, "Query text")->required();
        cmd->add_option("--hops", options_.maxHops, "Maximum hop depth (0 = configured)")
            ->default_val(0);
        cmd->add_option("--limit", options_.maxExpandedDocs,
                        "Maximum expanded documents (0 = configured)")
            ->default_val(0);
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ensured = cli_->ensureInitialized();
        if (!ensured) {
            return ensured;
        }

        const auto result = cli_->retriever().augmentDocuments(query_, {}, options_);

        if (cli_->getJsonOutput()) {
            nlohmann::json out{{"documents", result.documents},
                               {"entityQueryMode", result.entityQueryMode},
                               {"hasEntityEvidence", result.hasEntityEvidence},
                               {"resolvedEntities", result.resolvedEntities}};
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        if (!result.entityQueryMode) {
            fmt::print("Query does not name a known entity\n");
            return Result<void>();
        }
        for (const auto& doc : result.documents) {
            const auto& meta = doc.metadata;
            fmt::print("{:>6.3f}  {}\n", search::EntityGraphRetriever::documentScore(doc),
                       meta.value("path", std::string{}));
            fmt::print("        {}\n", preview(doc.pageContent));
        }
        return Result<void>();
    }

private:
    LoreGraphCLI* cli_{nullptr};
    std::string query_;
    search::EntityGraphAugmentationOptions options_;
};

std::unique_ptr<ICommand> createQueryCommand() {
    return std::make_unique<QueryCommand>();
}

} // namespace loregraph::cli
