#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <ragcore/cli/command.h>
#include <ragcore/cli/rag_cli.h>
#include <ragcore/cli/result_renderer.h>

namespace ragcore::cli {

namespace fs = std::filesystem;

namespace {

Result<std::string> readTextFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::InvalidData, "Failed reading " + path.string()};
    }
    return buffer.str();
}

// Copy an uploaded file into the artifact directory under a unique name
Result<fs::path> storeArtifact(const fs::path& source, const fs::path& artifactDir) {
    std::error_code ec;
    fs::create_directories(artifactDir, ec);
    if (ec) {
        return Error{ErrorCode::InvalidState,
                     "Cannot create artifact directory " + artifactDir.string() + ": " +
                         ec.message()};
    }
    const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    fs::path target = artifactDir / (std::to_string(stamp) + "_" + source.filename().string());
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
        return Error{ErrorCode::InvalidState,
                     "Cannot copy " + source.string() + " to artifacts: " + ec.message()};
    }
    return target;
}

} // namespace

class AddCommand : public ICommand {
public:
    std::string getName() const override { return "add"; }

    std::string getDescription() const override {
        return "Add a document to the knowledge base (queued as PENDING)";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("add", getDescription());

        cmd->add_option("--title", title_, "Document title")->required();
        cmd->add_option("--description", description_, "Short description");
        auto* fileOpt =
            cmd->add_option("--text-file", textFile_, "File holding the extracted text")
                ->check(CLI::ExistingFile);
        auto* textOpt = cmd->add_option("--text", text_, "Extracted text given inline");
        textOpt->excludes(fileOpt);
        cmd->add_option("--url", url_, "Source URL (text may be attached later)");
        cmd->add_option("--mime-type", mimeType_, "MIME type of the uploaded file")
            ->default_val("text/plain");
        cmd->add_option("--type", docType_, "Document type")->default_val("custom");
        cmd->add_option("--scope", scope_, "Visibility scope: global or user")
            ->default_val("global")
            ->check(CLI::IsMember({"global", "user"}));
        cmd->add_flag("--admin", adminManaged_, "Mark as admin-managed (curated)");
        cmd->add_option("--function", functions_, "Target function (repeatable)");
        cmd->add_option("--platform", platforms_, "Target platform (repeatable)");
        cmd->add_option("--tag", tags_, "Tag (repeatable)");
        cmd->add_option("--priority", priority_, "Priority 1-10")->default_val(5);
        cmd->add_option("--owner", owner_, "Uploading user");
        cmd->add_flag("--process", processNow_, "Process the document right away");

        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        ingest::IngestionRequest request;
        request.title = title_;
        request.description = description_;
        request.is_admin_managed = adminManaged_;
        request.priority = priority_;
        request.target_functions = std::set<std::string>(functions_.begin(), functions_.end());
        request.target_platforms = std::set<std::string>(platforms_.begin(), platforms_.end());
        request.tags = std::set<std::string>(tags_.begin(), tags_.end());
        if (!owner_.empty()) {
            request.owner = owner_;
        }

        auto type = metadata::parseDocumentType(docType_);
        if (!type) {
            return type.error();
        }
        request.doc_type = type.value();
        auto scope = metadata::parseDocumentScope(scope_);
        if (!scope) {
            return scope.error();
        }
        request.scope = scope.value();

        if (!textFile_.empty()) {
            auto text = readTextFile(textFile_);
            if (!text) {
                return text.error();
            }
            request.extracted_text = std::move(text).value();
        } else if (!text_.empty()) {
            request.extracted_text = text_;
        }

        std::optional<fs::path> artifact;
        if (!url_.empty()) {
            metadata::UrlSource source;
            source.url = url_;
            request.source = source;
        } else {
            if (!request.extracted_text) {
                return Error{ErrorCode::InvalidArgument, "Provide --text-file, --text or --url"};
            }
            metadata::FileSource source;
            source.mime_type = mimeType_;
            source.file_size = request.extracted_text->size();
            if (!textFile_.empty()) {
                auto stored = storeArtifact(textFile_, cli_->getConfig().storage.artifact_dir);
                if (!stored) {
                    return stored.error();
                }
                artifact = stored.value();
                source.file_name = fs::path(textFile_).filename().string();
                source.file_path = artifact->string();
            } else {
                source.file_name = title_;
            }
            request.source = source;
        }

        auto added = cli_->getGateway()->addDocument(request);
        if (!added) {
            if (artifact) {
                std::error_code ec;
                fs::remove(*artifact, ec);
            }
            return added.error();
        }

        if (!processNow_) {
            cli_->printJson({{"document_id", added.value().id},
                             {"status", std::string(metadata::toString(added.value().status))}});
            return {};
        }

        auto processed = cli_->getGateway()->process(added.value().id);
        if (!processed) {
            return processed.error();
        }
        cli_->printJson(renderDocument(processed.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    std::string title_;
    std::string description_;
    std::string textFile_;
    std::string text_;
    std::string url_;
    std::string mimeType_;
    std::string docType_;
    std::string scope_;
    bool adminManaged_ = false;
    std::vector<std::string> functions_;
    std::vector<std::string> platforms_;
    std::vector<std::string> tags_;
    int priority_ = 5;
    std::string owner_;
    bool processNow_ = false;
};

class AttachCommand : public ICommand {
public:
    std::string getName() const override { return "attach"; }

    std::string getDescription() const override {
        return "Attach fetched text to a URL document and queue it for processing";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("attach", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        cmd->add_option("--text-file", textFile_, "File holding the fetched text")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        auto text = readTextFile(textFile_);
        if (!text) {
            return text.error();
        }
        auto attached = cli_->getGateway()->attachExtractedText(id_, text.value());
        if (!attached) {
            return attached;
        }
        cli_->printJson({{"document_id", id_}, {"status", "PENDING"}});
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
    std::string textFile_;
};

std::unique_ptr<ICommand> createAddCommand() {
    return std::make_unique<AddCommand>();
}

std::unique_ptr<ICommand> createAttachCommand() {
    return std::make_unique<AttachCommand>();
}

} // namespace ragcore::cli
