#include <loregraph/cli/command_registry.h>
#include <loregraph/cli/loregraph_cli.h>
#include <loregraph/config/config_helpers.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

namespace loregraph::cli {

LoreGraphCLI::LoreGraphCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Entity graph index over markdown notes", "loregraph");
    app_->require_subcommand(1);

    app_->add_option("--vault", vaultPath_, "Vault root directory")->default_val(".");
    app_->add_option("--config", configPath_,
                     "Config file (default: $LOREGRAPH_CONFIG or ~/.config/loregraph/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    CommandRegistry::registerAllCommands(this);
}

LoreGraphCLI::~LoreGraphCLI() = default;

int LoreGraphCLI::run(int argc, char* argv[]) {
    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("loregraph", sink));
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        try {
            app_->parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_->exit(e);
        }

        spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                std::cerr << "[FAIL] " << pendingCommand_->getName() << ": "
                          << result.error().message << "\n";
                return 1;
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

Result<void> LoreGraphCLI::ensureInitialized() {
    if (index_) {
        return {};
    }

    const auto configFile = config::get_config_path(configPath_);
    auto loaded = config::loadSettings(configFile);
    if (!loaded) {
        return loaded.error();
    }
    auto graphSettings = std::move(loaded).value();
    if (graphSettings.debug && !verbose_) {
        spdlog::set_level(spdlog::level::info);
    }

    vault::VaultOptions options;
    options.includePatterns = graphSettings.includePatterns;
    options.excludePatterns = graphSettings.excludePatterns;
    auto opened = vault::MarkdownVault::open(config::expand_tilde(vaultPath_), std::move(options));
    if (!opened) {
        return opened.error();
    }

    settings_ = std::make_unique<config::SettingsStore>(std::move(graphSettings));
    vault_ = std::move(opened).value();
    chunker_ = std::make_unique<vault::ParagraphChunker>(*vault_);
    proposals_ = std::make_unique<graph::RelationProposalStore>();
    index_ = std::make_unique<graph::EntityGraphIndexManager>(*vault_, *settings_);
    retriever_ =
        std::make_unique<search::EntityGraphRetriever>(*index_, *vault_, *chunker_, *settings_);
    batchService_ = std::make_unique<graph::SemanticRelationBatchService>(*vault_, *settings_);

    spdlog::debug("Using config {} and vault {}", configFile.string(), vault_->root().string());
    return {};
}

void LoreGraphCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void LoreGraphCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

} // namespace loregraph::cli
