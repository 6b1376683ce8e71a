#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <ragcore/cli/command.h>
#include <ragcore/config/config.h>
#include <ragcore/ingest/ingestion_gateway.h>
#include <ragcore/ingest/lifecycle_manager.h>
#include <ragcore/metadata/knowledge_store.h>
#include <ragcore/search/retriever.h>
#include <ragcore/vector/embedder.h>

namespace ragcore::cli {

/**
 * Main CLI application class. Services are built on first use from the
 * resolved configuration.
 */
class RagCLI {
public:
    RagCLI();
    ~RagCLI();

    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Load configuration, set up logging, and open the knowledge store (lazy)
     */
    Result<void> ensureInitialized();

    const config::RagConfig& getConfig() const { return config_; }

    std::shared_ptr<metadata::IKnowledgeStore> getStore() const { return store_; }
    std::shared_ptr<vector::Embedder> getEmbedder() const { return embedder_; }
    std::shared_ptr<ingest::IngestionGateway> getGateway() const { return gateway_; }
    std::shared_ptr<ingest::LifecycleManager> getLifecycle() const { return lifecycle_; }
    std::shared_ptr<search::Retriever> getRetriever() const { return retriever_; }

    bool getVerbose() const { return verbose_; }

    // Pretty-printed JSON on stdout
    void printJson(const nlohmann::json& value) const;

    /**
     * Subcommand callback tail: on error, print it to stderr and make the
     * process exit non-zero
     */
    void handleResult(const Result<void>& result) const;

private:
    void configureLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string databasePath_;
    bool verbose_ = false;
    bool initialized_ = false;

    config::RagConfig config_;
    std::shared_ptr<metadata::SqliteKnowledgeStore> store_;
    std::shared_ptr<vector::Embedder> embedder_;
    std::shared_ptr<ingest::IngestionGateway> gateway_;
    std::shared_ptr<ingest::LifecycleManager> lifecycle_;
    std::shared_ptr<search::Retriever> retriever_;
};

} // namespace ragcore::cli
