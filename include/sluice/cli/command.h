#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <sluice/core/types.h>

namespace sluice::cli {

class SluiceCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "download", "status")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, SluiceCLI* cli) = 0;

    /**
     * Execute the command. The process exit code is reported through SluiceCLI::setExitCode.
     */
    virtual Result<void> execute() = 0;
};

} // namespace sluice::cli
