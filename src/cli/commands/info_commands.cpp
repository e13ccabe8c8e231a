#include <mediadex/cli/mediadex_cli.h>

namespace mediadex::cli {

class SamplersCommand : public ICommand {
public:
    std::string getName() const override { return "samplers"; }
    std::string getDescription() const override {
        return "Show the file record and sampler rows of one indexed file";
    }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("samplers", getDescription());
        cmd->add_option("id", id_, "File id")->required();
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto& service = ctx.value()->service();

        auto file = service.getFile(id_);
        if (!file) {
            return file.error();
        }
        if (!file.value()) {
            return Error{ErrorCode::NotFound, "No indexed file with id " + id_};
        }
        auto samplers = service.getSamplers(id_);
        if (!samplers) {
            return samplers.error();
        }
        cli_->emit(json{{"file", toJson(*file.value())}, {"samplers", toJson(samplers.value())}});
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    std::string id_;
};

class OptionsCommand : public ICommand {
public:
    std::string getName() const override { return "options"; }
    std::string getDescription() const override {
        return "Distinct models, samplers and schedulers with value ranges";
    }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("options", getDescription());
        cmd->add_option("--folder", scope_.folder, "Restrict to one folder");
        cmd->add_flag("-r,--recursive", scope_.recursive, "Include subfolders of --folder");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto options = ctx.value()->service().filterOptions(scope_);
        if (!options) {
            return options.error();
        }
        cli_->emit(toJson(options.value()));
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    metadata::FolderScope scope_;
};

class StatsCommand : public ICommand {
public:
    std::string getName() const override { return "stats"; }
    std::string getDescription() const override { return "Index counters"; }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("stats", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto stats = ctx.value()->service().stats();
        if (!stats) {
            return stats.error();
        }
        auto out = toJson(stats.value());
        if (auto version = ctx.value()->store().schemaVersion()) {
            out["schema_version"] = version.value();
        }
        out["database"] = ctx.value()->config().databasePath().string();
        cli_->emit(out);
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createSamplersCommand() {
    return std::make_unique<SamplersCommand>();
}

std::unique_ptr<ICommand> createOptionsCommand() {
    return std::make_unique<OptionsCommand>();
}

std::unique_ptr<ICommand> createStatsCommand() {
    return std::make_unique<StatsCommand>();
}

} // namespace mediadex::cli
