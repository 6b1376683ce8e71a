#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <ragcore/core/types.h>

namespace ragcore::cli {

class RagCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "add", "search")
     */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, RagCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace ragcore::cli
