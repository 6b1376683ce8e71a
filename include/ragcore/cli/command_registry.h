#pragma once

#include <memory>
#include <ragcore/cli/command.h>

namespace ragcore::cli {

class RagCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(RagCLI* cli);

    static std::unique_ptr<ICommand> createAddCommand();
    static std::unique_ptr<ICommand> createAttachCommand();
    static std::unique_ptr<ICommand> createProcessCommand();
    static std::unique_ptr<ICommand> createReprocessCommand();
    static std::unique_ptr<ICommand> createProcessPendingCommand();
    static std::unique_ptr<ICommand> createRetryFailedCommand();
    static std::unique_ptr<ICommand> createRefreshEmbeddingsCommand();
    static std::unique_ptr<ICommand> createSearchCommand();
    static std::unique_ptr<ICommand> createContextCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createShowCommand();
    static std::unique_ptr<ICommand> createUpdateCommand();
    static std::unique_ptr<ICommand> createDeleteCommand();
    static std::unique_ptr<ICommand> createStatsCommand();
};

} // namespace ragcore::cli
