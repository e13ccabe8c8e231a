#include <spdlog/spdlog.h>
#include <iostream>
#include <mediadex/cli/mediadex_cli.h>

namespace mediadex::cli {

class SyncCommand : public ICommand {
public:
    std::string getName() const override { return "sync"; }

    std::string getDescription() const override {
        return "Reconcile the index with the media files on disk";
    }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("sync", getDescription());
        cmd->add_option("--folder", folder_, "Sync a single folder instead of the whole gallery");
        cmd->add_flag("--quiet", quiet_, "Do not report progress on stderr");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        if (MediadexCLI::shutdownRequested()) {
            return {};
        }

        sync::ProgressCallback progress;
        if (!quiet_) {
            progress = [](const sync::SyncProgress& p) {
                std::cerr << "[" << sync::syncStatusName(p.status) << "] " << p.message;
                if (p.total > 0) {
                    std::cerr << " (" << p.current << "/" << p.total << ")";
                }
                std::cerr << "\n";
            };
        }

        auto summary = folder_.empty() ? ctx.value()->startupSync(progress)
                                       : ctx.value()->syncEngine().runFolderSync(folder_, progress);
        if (!summary) {
            return summary.error();
        }
        cli_->emit(toJson(summary.value()));
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::string folder_;
    bool quiet_ = false;
};

std::unique_ptr<ICommand> createSyncCommand() {
    return std::make_unique<SyncCommand>();
}

} // namespace mediadex::cli
