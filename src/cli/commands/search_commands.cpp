#include <ragcore/cli/command.h>
#include <ragcore/cli/rag_cli.h>
#include <ragcore/cli/result_renderer.h>

namespace ragcore::cli {

namespace {

// Filter and visibility options shared by search and context
struct QueryOptions {
    std::string query;
    std::string function;
    std::string platform;
    std::string docType;
    std::string owner;
    bool noAdmin = false;
    bool noUser = false;

    void registerOn(CLI::App* cmd) {
        cmd->add_option("query", query, "Natural-language query")->required();
        cmd->add_option("--function", function, "Only documents applying to this function");
        cmd->add_option("--platform", platform, "Only documents applying to this platform");
        cmd->add_option("--type", docType, "Only documents of this type");
        cmd->add_option("--owner", owner, "Searching user; limits user documents to theirs");
        cmd->add_flag("--no-admin", noAdmin, "Exclude admin-managed documents");
        cmd->add_flag("--no-user", noUser, "Exclude user-managed documents");
    }

    search::Visibility visibility() const {
        search::Visibility v;
        if (!owner.empty()) {
            v.owner = owner;
        }
        v.include_admin_managed = !noAdmin;
        v.include_user_managed = !noUser;
        return v;
    }

    template <typename Request> Result<void> fill(Request& request) const {
        request.query = query;
        if (!function.empty()) {
            request.target_function = function;
        }
        if (!platform.empty()) {
            request.target_platform = platform;
        }
        if (!docType.empty()) {
            auto type = metadata::parseDocumentType(docType);
            if (!type) {
                return type.error();
            }
            request.doc_type = type.value();
        }
        request.visibility = visibility();
        return {};
    }
};

} // namespace

class SearchCommand : public ICommand {
public:
    std::string getName() const override { return "search"; }

    std::string getDescription() const override {
        return "Rank knowledge chunks against a query";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("search", getDescription());
        options_.registerOn(cmd);
        topKOpt_ = cmd->add_option("-k,--top-k", topK_, "Maximum results (default from config)");
        minSimilarityOpt_ = cmd->add_option("--min-similarity", minSimilarity_,
                                            "Similarity threshold (default from config)");
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        const auto& retrieval = cli_->getConfig().retrieval;
        search::SearchRequest request;
        auto filled = options_.fill(request);
        if (!filled) {
            return filled;
        }
        request.top_k = topKOpt_->count() > 0 ? topK_ : retrieval.top_k;
        request.min_similarity =
            minSimilarityOpt_->count() > 0 ? minSimilarity_ : retrieval.min_similarity;

        auto results = cli_->getRetriever()->search(request);
        if (!results) {
            return results.error();
        }
        cli_->printJson(renderSearchResults(results.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    QueryOptions options_;
    size_t topK_ = 0;
    double minSimilarity_ = 0.0;
    CLI::Option* topKOpt_ = nullptr;
    CLI::Option* minSimilarityOpt_ = nullptr;
};

class ContextCommand : public ICommand {
public:
    std::string getName() const override { return "context"; }

    std::string getDescription() const override {
        return "Assemble prompt context for a query within a token budget";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("context", getDescription());
        options_.registerOn(cmd);
        maxTokensOpt_ = cmd->add_option("--max-tokens", maxTokens_,
                                        "Token budget (default from config)");
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        search::ContextRequest request;
        auto filled = options_.fill(request);
        if (!filled) {
            return filled;
        }
        request.max_tokens = maxTokensOpt_->count() > 0
                                 ? maxTokens_
                                 : cli_->getConfig().retrieval.context_max_tokens;

        auto context = cli_->getRetriever()->getContextForPrompt(request);
        if (!context) {
            return context.error();
        }
        cli_->printJson(renderContext(context.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    QueryOptions options_;
    size_t maxTokens_ = 0;
    CLI::Option* maxTokensOpt_ = nullptr;
};

std::unique_ptr<ICommand> createSearchCommand() {
    return std::make_unique<SearchCommand>();
}

std::unique_ptr<ICommand> createContextCommand() {
    return std::make_unique<ContextCommand>();
}

} // namespace ragcore::cli
