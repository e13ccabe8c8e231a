#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <mediadex/core/types.h>

namespace mediadex::cli {

class MediadexCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, MediadexCLI* cli) = 0;

    virtual Result<void> execute() = 0;
};

} // namespace mediadex::cli
