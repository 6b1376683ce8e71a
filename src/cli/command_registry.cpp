#include <ragcore/cli/command_registry.h>
#include <ragcore/cli/rag_cli.h>

namespace ragcore::cli {

// Defined alongside each command
std::unique_ptr<ICommand> createAddCommand();
std::unique_ptr<ICommand> createAttachCommand();
std::unique_ptr<ICommand> createProcessCommand();
std::unique_ptr<ICommand> createReprocessCommand();
std::unique_ptr<ICommand> createProcessPendingCommand();
std::unique_ptr<ICommand> createRetryFailedCommand();
std::unique_ptr<ICommand> createRefreshEmbeddingsCommand();
std::unique_ptr<ICommand> createSearchCommand();
std::unique_ptr<ICommand> createContextCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createShowCommand();
std::unique_ptr<ICommand> createUpdateCommand();
std::unique_ptr<ICommand> createDeleteCommand();
std::unique_ptr<ICommand> createStatsCommand();

void CommandRegistry::registerAllCommands(RagCLI* cli) {
    cli->registerCommand(CommandRegistry::createAddCommand());
    cli->registerCommand(CommandRegistry::createAttachCommand());
    cli->registerCommand(CommandRegistry::createProcessCommand());
    cli->registerCommand(CommandRegistry::createReprocessCommand());
    cli->registerCommand(CommandRegistry::createProcessPendingCommand());
    cli->registerCommand(CommandRegistry::createRetryFailedCommand());
    cli->registerCommand(CommandRegistry::createRefreshEmbeddingsCommand());
    cli->registerCommand(CommandRegistry::createSearchCommand());
    cli->registerCommand(CommandRegistry::createContextCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createShowCommand());
    cli->registerCommand(CommandRegistry::createUpdateCommand());
    cli->registerCommand(CommandRegistry::createDeleteCommand());
    cli->registerCommand(CommandRegistry::createStatsCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createAddCommand() {
    return ::ragcore::cli::createAddCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createAttachCommand() {
    return ::ragcore::cli::createAttachCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createProcessCommand() {
    return ::ragcore::cli::createProcessCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createReprocessCommand() {
    return ::ragcore::cli::createReprocessCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createProcessPendingCommand() {
    return ::ragcore::cli::createProcessPendingCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRetryFailedCommand() {
    return ::ragcore::cli::createRetryFailedCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRefreshEmbeddingsCommand() {
    return ::ragcore::cli::createRefreshEmbeddingsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSearchCommand() {
    return ::ragcore::cli::createSearchCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createContextCommand() {
    return ::ragcore::cli::createContextCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::ragcore::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createShowCommand() {
    return ::ragcore::cli::createShowCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createUpdateCommand() {
    return ::ragcore::cli::createUpdateCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createDeleteCommand() {
    return ::ragcore::cli::createDeleteCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatsCommand() {
    return ::ragcore::cli::createStatsCommand();
}

} // namespace ragcore::cli
