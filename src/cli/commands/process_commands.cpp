#include <ragcore/cli/command.h>
#include <ragcore/cli/interrupt_scope.h>
#include <ragcore/cli/rag_cli.h>
#include <ragcore/cli/result_renderer.h>

namespace ragcore::cli {

class ProcessCommand : public ICommand {
public:
    std::string getName() const override { return "process"; }

    std::string getDescription() const override {
        return "Chunk and embed a PENDING or FAILED document";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("process", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        InterruptScope interrupt;
        auto processed = cli_->getGateway()->process(id_, interrupt.token());
        if (!processed) {
            return processed.error();
        }
        cli_->printJson(renderDocument(processed.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
};

class ReprocessCommand : public ICommand {
public:
    std::string getName() const override { return "reprocess"; }

    std::string getDescription() const override {
        return "Rebuild the chunks of a READY or FAILED document";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("reprocess", getDescription());
        cmd->add_option("id", id_, "Document id")->required();
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        InterruptScope interrupt;
        auto processed = cli_->getLifecycle()->reprocess(id_, interrupt.token());
        if (!processed) {
            return processed.error();
        }
        cli_->printJson(renderDocument(processed.value()));
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    DocumentId id_ = 0;
};

class ProcessPendingCommand : public ICommand {
public:
    std::string getName() const override { return "process-pending"; }

    std::string getDescription() const override {
        return "Process every PENDING document on the worker pool";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("process-pending", getDescription());
        cmd->add_flag("--recover", recover_,
                      "First requeue documents a dead process left PROCESSING");
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }

        size_t recovered = 0;
        if (recover_) {
            auto r = cli_->getLifecycle()->recoverInterrupted();
            if (!r) {
                return r.error();
            }
            recovered = r.value();
        }

        InterruptScope interrupt;
        auto report = cli_->getLifecycle()->processPending(interrupt.token());
        if (!report) {
            return report.error();
        }
        auto out = renderBatchReport(report.value());
        if (recover_) {
            out["recovered"] = recovered;
        }
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    bool recover_ = false;
};

class RetryFailedCommand : public ICommand {
public:
    std::string getName() const override { return "retry-failed"; }

    std::string getDescription() const override {
        return "Requeue FAILED documents, optionally processing them";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("retry-failed", getDescription());
        cmd->add_flag("--process", processNow_, "Process the requeued documents right away");
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        auto reset = cli_->getLifecycle()->resetFailed();
        if (!reset) {
            return reset.error();
        }

        nlohmann::json out = {{"reset", reset.value()}};
        if (processNow_) {
            InterruptScope interrupt;
            auto report = cli_->getLifecycle()->processPending(interrupt.token());
            if (!report) {
                return report.error();
            }
            out["batch"] = renderBatchReport(report.value());
        }
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
    bool processNow_ = false;
};

class RefreshEmbeddingsCommand : public ICommand {
public:
    std::string getName() const override { return "refresh-embeddings"; }

    std::string getDescription() const override {
        return "Reprocess documents embedded by a model other than the current one";
    }

    void registerCommand(CLI::App& app, RagCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("refresh-embeddings", getDescription());
        cmd->callback([this]() { cli_->handleResult(execute()); });
    }

    Result<void> execute() override {
        auto ready = cli_->ensureInitialized();
        if (!ready) {
            return ready;
        }
        InterruptScope interrupt;
        auto report = cli_->getLifecycle()->refreshStaleEmbeddings(interrupt.token());
        if (!report) {
            return report.error();
        }
        auto out = renderBatchReport(report.value());
        out["model"] = cli_->getEmbedder()->preferredModelId();
        cli_->printJson(out);
        return {};
    }

private:
    RagCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createProcessCommand() {
    return std::make_unique<ProcessCommand>();
}

std::unique_ptr<ICommand> createReprocessCommand() {
    return std::make_unique<ReprocessCommand>();
}

std::unique_ptr<ICommand> createProcessPendingCommand() {
    return std::make_unique<ProcessPendingCommand>();
}

std::unique_ptr<ICommand> createRetryFailedCommand() {
    return std::make_unique<RetryFailedCommand>();
}

std::unique_ptr<ICommand> createRefreshEmbeddingsCommand() {
    return std::make_unique<RefreshEmbeddingsCommand>();
}

} // namespace ragcore::cli
