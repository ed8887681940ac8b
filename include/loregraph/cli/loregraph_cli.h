#pragma once

#include <loregraph/cli/command.h>
#include <loregraph/config/settings.h>
#include <loregraph/graph/entity_graph_index.h>
#include <loregraph/graph/relation_proposal_store.h>
#include <loregraph/graph/semantic_relation_batch_service.h>
#include <loregraph/search/entity_graph_retriever.h>
#include <loregraph/vault/markdown_vault.h>
#include <loregraph/vault/paragraph_chunker.h>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace loregraph::cli {

/**
 * Main CLI application class
 */
class LoreGraphCLI {
public:
    LoreGraphCLI();
    ~LoreGraphCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Load settings, open the vault and wire the graph services (lazy, idempotent)
     */
    Result<void> ensureInitialized();

    // Service accessors; valid after ensureInitialized() succeeded
    config::SettingsStore& settings() { return *settings_; }
    vault::MarkdownVault& vault() { return *vault_; }
    vault::ParagraphChunker& chunker() { return *chunker_; }
    graph::EntityGraphIndexManager& index() { return *index_; }
    search::EntityGraphRetriever& retriever() { return *retriever_; }
    graph::SemanticRelationBatchService& batchService() { return *batchService_; }
    graph::RelationProposalStore& proposals() { return *proposals_; }

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing
     */
    void setPendingCommand(ICommand* cmd);

private:
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string vaultPath_{"."};
    std::string configPath_;
    bool verbose_{false};
    bool jsonOutput_{false};

    // Declaration order is teardown order in reverse: the index unregisters from the vault and
    // the settings store before either is destroyed.
    std::unique_ptr<config::SettingsStore> settings_;
    std::unique_ptr<vault::MarkdownVault> vault_;
    std::unique_ptr<vault::ParagraphChunker> chunker_;
    std::unique_ptr<graph::RelationProposalStore> proposals_;
    std::unique_ptr<graph::EntityGraphIndexManager> index_;
    std::unique_ptr<search::EntityGraphRetriever> retriever_;
    std::unique_ptr<graph::SemanticRelationBatchService> batchService_;
};

} // namespace loregraph::cli
