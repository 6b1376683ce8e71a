#include <ragcore/cli/command.h>
#include <ragcore/cli/rag_cli.h>
#include <ragcore/cli/result_renderer.h>

namespace ragcore::cli {

using json = nlohmann::json;

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override { return "List documents, newest first"; }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->add_option("--status", status_, "PENDING, PROCESSING, READY or FAILED");
        cmd->add_option("--type", docType_, "Document type");
        cmd->add_option("--owner", owner_, "Uploading user");
        cmd->add_flag("--active-only", activeOnly_, "Hide deactivated documents");
        cmd->add_option("--limit", limit_, "Maximum documents (0 = all)")->default_val(100);
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        metadata::DocumentQuery query;
        query.limit = limit_;
        if (!status_.empty()) {
            auto status = metadata::parseDocumentStatus(status_);
            if (!status) {
                return status.error();
            }
            query.status = status.value();
        }
        if (!docType_.empty()) {
            auto type = metadata::parseDocumentType(docType_);
            if (!type) {
                return type.error();
            }
            query.doc_type = type.value();
        }
        if (!owner_.empty()) {
            query.owner = owner_;
        }
        if (activeOnly_) {
            query.is_active = true;
        }

        auto docs = cli_->getStore()->listDocuments(query);
        if (!docs) {
            return docs.error();
        }
        json out = json::array();
        for (const auto& doc : docs.value()) {
            out.push_back(renderDocument(doc));
        }
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    std::string status_;
    std::string docType_;
    std::string owner_;
    bool activeOnly_ = false;
    int limit_ = 100;
};

class ShowCommand : public ICommand {
public:
    std::string getName() const override { return "show"; }

    std::string getDescription() const override { return "Show one document"; }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("show", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        cmd->add_flag("--content", withContent_, "Include the extracted text");
        cmd->add_flag("--chunks", withChunks_, "Include the stored chunks");
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        auto doc = cli_->getStore()->getDocument(id_);
        if (!doc) {
            return doc.error();
        }
        if (!doc.value()) {
            return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id_)};
        }

        json out = renderDocument(*doc.value(), withContent_);
        if (withChunks_) {
            auto chunks = cli_->getStore()->listChunks({id_});
            if (!chunks) {
                return chunks.error();
            }
            json arr = json::array();
            for (const auto& c : chunks.value()) {
                arr.push_back({{"chunk_id", c.id},
                               {"chunk_index", c.chunk_index},
                               {"start_char", c.start_char},
                               {"end_char", c.end_char},
                               {"token_count", c.token_count},
                               {"embedding_model", c.embedding_model},
                               {"dimension", c.embedding.size()},
                               {"content", c.content}});
            }
            out["chunks"] = arr;
        }
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
    bool withContent_ = false;
    bool withChunks_ = false;
};

class UpdateCommand : public ICommand {
public:
    std::string getName() const override { return "update"; }

    std::string getDescription() const override {
        return "Edit document metadata (chunks are unaffected)";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("update", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        titleOpt_ = cmd->add_option("--title", title_, "New title");
        descriptionOpt_ = cmd->add_option("--description", description_, "New description");
        functionsOpt_ = cmd->add_option("--function", functions_, "Replace target functions");
        platformsOpt_ = cmd->add_option("--platform", platforms_, "Replace target platforms");
        tagsOpt_ = cmd->add_option("--tag", tags_, "Replace tags");
        priorityOpt_ = cmd->add_option("--priority", priority_, "New priority 1-10");
        auto* activate = cmd->add_flag("--activate", activate_, "Make searchable again");
        auto* deactivate =
            cmd->add_flag("--deactivate", deactivate_, "Hide from search and dedup");
        activate->excludes(deactivate);
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        metadata::DocumentUpdate update;
        if (titleOpt_->count() > 0)
            update.title = title_;
        if (descriptionOpt_->count() > 0)
            update.description = description_;
        if (functionsOpt_->count() > 0)
            update.target_functions = std::set<std::string>(functions_.begin(), functions_.end());
        if (platformsOpt_->count() > 0)
            update.target_platforms = std::set<std::string>(platforms_.begin(), platforms_.end());
        if (tagsOpt_->count() > 0)
            update.tags = std::set<std::string>(tags_.begin(), tags_.end());
        if (priorityOpt_->count() > 0)
            update.priority = priority_;
        if (activate_)
            update.is_active = true;
        if (deactivate_)
            update.is_active = false;

        auto updated = cli_->getStore()->updateDocumentMetadata(id_, update);
        if (!updated) {
            return updated;
        }
        auto doc = cli_->getStore()->getDocument(id_);
        if (!doc) {
            return doc.error();
        }
        if (!doc.value()) {
            return Error{ErrorCode::NotFound, "Document not found: " + std::to_string(id_)};
        }
        cli_->printJson(renderDocument(*doc.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
    std::string title_;
    std::string description_;
    std::vector<std::string> functions_;
    std::vector<std::string> platforms_;
    std::vector<std::string> tags_;
    int priority_ = 5;
    bool activate_ = false;
    bool deactivate_ = false;
    CLI::Option* titleOpt_ = nullptr;
    CLI::Option* descriptionOpt_ = nullptr;
    CLI::Option* functionsOpt_ = nullptr;
    CLI::Option* platformsOpt_ = nullptr;
    CLI::Option* tagsOpt_ = nullptr;
    CLI::Option* priorityOpt_ = nullptr;
};

class DeleteCommand : public ICommand {
public:
    std::string getName() const override { return "delete"; }

    std::string getDescription() const override {
        return "Delete a document, its chunks and its stored file";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("delete", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        auto deleted = cli_->getLifecycle()->deleteDocument(id_);
        if (!deleted) {
            return deleted;
        }
        cli_->printJson({{"deleted", id_}});
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
};

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }

    std::string getDescription() const override { return "Knowledge base statistics"; }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("stats", getDescription());
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        auto stats = cli_->getStore()->getStats();
        if (!stats) {
            return stats.error();
        }
        json out = renderStats(stats.value());
        out["embedding_model"] = cli_->getEmbedder()->preferredModelId();
        out["database"] = cli_->getConfig().storage.database_path.string();
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

std::unique_ptr<ICommand> createShowCommand() {
    return std::make_unique<ShowCommand>();
}

std::unique_ptr<ICommand> createUpdateCommand() {
    return std::make_unique<UpdateCommand>();
}

std::unique_ptr<ICommand> createDeleteCommand() {
    return std::make_unique<DeleteCommand>();
}

std::unique_ptr<ICommand> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace ragcore::cli
