#include <spdlog/spdlog.h>
#include <iostream>
#include <ragcore/cli/command_registry.h>
#include <ragcore/cli/rag_cli.h>
#include <ragcore/cli/result_renderer.h>
#include <ragcore/config/config_helpers.h>

#ifndef RAGCORE_VERSION_STRING
#define RAGCORE_VERSION_STRING "0.0.0"
#endif

namespace ragcore::cli {

namespace fs = std::filesystem;

RagCLI::RagCLI() {
    app_ = std::make_unique<CLI::App>("ragcore knowledge retrieval engine", "ragcore-cli");
    app_->set_version_flag("--version", RAGCORE_VERSION_STRING);
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_,
                     "Config file (default: $RAGCORE_CONFIG or ~/.config/ragcore/config.toml)");
    app_->add_option("--db", databasePath_, "Knowledge database path (overrides config)");
    app_->add_flag("-v,--verbose", verbose_, "Enable debug logging");
}

RagCLI::~RagCLI() = default;

void RagCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int RagCLI::run(int argc, char* argv[]) {
    CommandRegistry::registerAllCommands(this);
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }
    return 0;
}

void RagCLI::configureLogging() {
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    spdlog::set_level(spdlog::level::from_str(config_.log_level));
}

Result<void> RagCLI::ensureInitialized() {
    if (initialized_) {
        return {};
    }

    if (!configPath_.empty()) {
        std::error_code ec;
        if (!fs::exists(config::expand_tilde(configPath_), ec)) {
            return Error{ErrorCode::NotFound, "Config file not found: " + configPath_};
        }
    }

    auto loaded = config::loadConfig(config::get_config_path(configPath_));
    if (!loaded) {
        return loaded.error();
    }
    config_ = std::move(loaded).value();
    if (!databasePath_.empty()) {
        config_.storage.database_path = config::expand_tilde(databasePath_);
    }
    configureLogging();

    store_ = std::make_shared<metadata::SqliteKnowledgeStore>(
        config_.storage.database_path.string());
    auto opened = store_->initialize();
    if (!opened) {
        return opened;
    }

    embedder_ = std::make_shared<vector::Embedder>(vector::makeEmbeddingStrategy(config_.embedding));

    chunking::ChunkingConfig chunking;
    chunking.chunk_size = config_.chunking.chunk_size;
    chunking.overlap = config_.chunking.overlap;
    gateway_ = std::make_shared<ingest::IngestionGateway>(store_, embedder_, chunking);
    lifecycle_ =
        std::make_shared<ingest::LifecycleManager>(store_, gateway_, config_.ingestion.workers);

    search::RetrieverOptions retrieval;
    retrieval.context_candidates = config_.retrieval.context_candidates;
    retrieval.min_similarity = config_.retrieval.min_similarity;
    retriever_ = std::make_shared<search::Retriever>(store_, embedder_, retrieval);

    spdlog::debug("Using database {} with embedding model {}", store_->path(),
                  embedder_->preferredModelId());
    initialized_ = true;
    return {};
}

void RagCLI::printJson(const nlohmann::json& value) const {
    std::cout << value.dump(2) << std::endl;
}

void RagCLI::handleResult(const Result<void>& result) const {
    if (result) {
        return;
    }
    std::cerr << renderError(result.error()).dump() << std::endl;
    throw CLI::RuntimeError(1);
}

} // namespace ragcore::cli
