#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <mediadex/app/gallery_context.h>
#include <mediadex/cli/command.h>
#include <mediadex/cli/json_output.h>
#include <mediadex/core/types.h>

namespace mediadex::cli {

/**
 * @brief Command line front end
 *
 * Commands share one lazily created GalleryContext. The context is shut
 * down before run() returns, also after a signal.
 */
class MediadexCLI {
public:
    MediadexCLI();
    ~MediadexCLI();

    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /// Commands defer execution until parsing has finished
    void setPendingCommand(ICommand* cmd) { pending_ = cmd; }

    /// Load the configuration and open the gallery on first use
    Result<app::GalleryContext*> context();

    /// Set by SIGINT/SIGTERM
    static bool shutdownRequested();
    static void requestShutdown();

    /// Pretty-printed JSON on stdout
    void emit(const json& value) const;

private:
    void installSignalHandlers();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pending_ = nullptr;
    std::unique_ptr<app::GalleryContext> context_;

    std::string configPath_;
    std::string logLevel_;
    bool compact_ = false;
};

std::unique_ptr<ICommand> createSyncCommand();
std::unique_ptr<ICommand> createQueryCommand();
std::unique_ptr<ICommand> createSamplersCommand();
std::unique_ptr<ICommand> createOptionsCommand();
std::unique_ptr<ICommand> createStatsCommand();
std::unique_ptr<ICommand> createFavoriteCommand();
std::unique_ptr<ICommand> createRenameCommand();
std::unique_ptr<ICommand> createMoveCommand();
std::unique_ptr<ICommand> createDeleteCommand();

} // namespace mediadex::cli
