#include <mediadex/cli/mediadex_cli.h>

namespace mediadex::cli {

namespace {

json reportJson(const app::MutationReport& report) {
    json failed = json::array();
    for (const auto& [id, reason] : report.failed) {
        failed.push_back({{"id", id}, {"reason", reason}});
    }
    return json{{"succeeded", report.succeeded},
                {"failed", std::move(failed)},
                {"renamed", report.renamed}};
}

} // namespace

class FavoriteCommand : public ICommand {
public:
    std::string getName() const override { return "favorite"; }
    std::string getDescription() const override { return "Mark or unmark files as favourites"; }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("favorite", getDescription());
        cmd->add_option("ids", ids_, "File ids")->required();
        cmd->add_flag("--unset", unset_, "Remove the favourite mark");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto updated = ctx.value()->service().markFavorite(ids_, !unset_);
        if (!updated) {
            return updated.error();
        }
        cli_->emit(json{{"updated", updated.value()}});
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::vector<std::string> ids_;
    bool unset_ = false;
};

class RenameCommand : public ICommand {
public:
    std::string getName() const override { return "rename"; }
    std::string getDescription() const override { return "Rename a file within its folder"; }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("rename", getDescription());
        cmd->add_option("id", id_, "File id")->required();
        cmd->add_option("name", name_, "New file name; the extension is kept when omitted")
            ->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto renamed = ctx.value()->service().renamePath(id_, name_);
        if (!renamed) {
            return renamed.error();
        }
        cli_->emit(toJson(renamed.value()));
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::string id_;
    std::string name_;
};

class MoveCommand : public ICommand {
public:
    std::string getName() const override { return "move"; }
    std::string getDescription() const override { return "Move files to another gallery folder"; }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("move", getDescription());
        cmd->add_option("--to", destination_, "Destination folder")->required();
        cmd->add_option("ids", ids_, "File ids")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto report = ctx.value()->service().movePath(ids_, destination_);
        if (!report) {
            return report.error();
        }
        cli_->emit(reportJson(report.value()));
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::vector<std::string> ids_;
    std::string destination_;
};

class DeleteCommand : public ICommand {
public:
    std::string getName() const override { return "delete"; }
    std::string getDescription() const override {
        return "Delete files from disk together with their index rows";
    }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("delete", getDescription());
        cmd->add_option("ids", ids_, "File ids")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto report = ctx.value()->service().deletePath(ids_);
        if (!report) {
            return report.error();
        }
        cli_->emit(reportJson(report.value()));
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::vector<std::string> ids_;
};

std::unique_ptr<ICommand> createFavoriteCommand() {
    return std::make_unique<FavoriteCommand>();
}

std::unique_ptr<ICommand> createRenameCommand() {
    return std::make_unique<RenameCommand>();
}

std::unique_ptr<ICommand> createMoveCommand() {
    return std::make_unique<MoveCommand>();
}

std::unique_ptr<ICommand> createDeleteCommand() {
    return std::make_unique<DeleteCommand>();
}

} // namespace mediadex::cli
