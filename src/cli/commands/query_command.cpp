#include <chrono>
#include <mediadex/cli/mediadex_cli.h>

namespace mediadex::cli {

class QueryCommand : public ICommand {
public:
    std::string getName() const override { return "query"; }

    std::string getDescription() const override {
        return "List indexed files matching folder and generation filters";
    }

    void registerCommand(CLI::App& app, MediadexCLI* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand("query", getDescription());
        cmd->add_option("--folder", folder_, "Restrict to one folder");
        cmd->add_flag("-r,--recursive", recursive_, "Include subfolders of --folder");

        auto& meta = query_.metadata;
        cmd->add_option("--model", meta.model, "Checkpoint or diffusion model name");
        cmd->add_option("--sampler", meta.sampler, "Sampler name");
        cmd->add_option("--scheduler", meta.scheduler, "Scheduler name");
        cmd->add_option("--cfg-min", meta.cfgMin);
        cmd->add_option("--cfg-max", meta.cfgMax);
        cmd->add_option("--steps-min", meta.stepsMin);
        cmd->add_option("--steps-max", meta.stepsMax);
        cmd->add_option("--width-min", meta.widthMin);
        cmd->add_option("--width-max", meta.widthMax);
        cmd->add_option("--height-min", meta.heightMin);
        cmd->add_option("--height-max", meta.heightMax);
        cmd->add_flag("--same-sampler", sameSampler_,
                      "All metadata criteria must hold for the same sampler");

        cmd->add_option("--search", query_.search, "Case-insensitive name substring");
        cmd->add_flag("--favorites", query_.favoritesOnly, "Favourites only");
        cmd->add_option("--prefix", query_.prefixes, "Name prefix before '_' (repeatable)");
        cmd->add_option("--ext", query_.extensions, "File extension (repeatable)");

        cmd->add_option("--sort", sort_, "Sort key")
            ->default_val("mtime")
            ->check(CLI::IsMember({"mtime", "name"}));
        cmd->add_flag("--asc", ascending_, "Ascending order");
        cmd->add_option("--page", page_, "1-based page number")
            ->default_val(1)
            ->check(CLI::PositiveNumber);
        cmd->add_option("--page-size", pageSize_, "Rows per page (default from config)")
            ->check(CLI::PositiveNumber);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto ctx = cli_->context();
        if (!ctx) {
            return ctx.error();
        }
        auto* gallery = ctx.value();

        query_.scope.folder = folder_;
        query_.scope.recursive = recursive_ && !folder_.empty();
        if (sameSampler_) {
            query_.metadata.match = metadata::SamplerMatch::SameSampler;
        }

        metadata::PageRequest request;
        request.sort = sort_ == "name" ? metadata::SortKey::Name : metadata::SortKey::ModifiedTime;
        request.direction =
            ascending_ ? metadata::SortDirection::Ascending : metadata::SortDirection::Descending;
        request.limit = pageSize_ > 0 ? pageSize_
                                      : static_cast<int64_t>(gallery->config().pageSize);
        request.offset = (page_ - 1) * request.limit;

        auto started = std::chrono::steady_clock::now();
        auto page = gallery->service().queryPage(query_, request);
        gallery->service().recordTiming("query", std::chrono::steady_clock::now() - started);
        if (!page) {
            return page.error();
        }

        auto out = toJson(page.value());
        out["page"] = page_;
        out["page_size"] = request.limit;
        cli_->emit(out);
        return {};
    }

private:
    MediadexCLI* cli_ = nullptr;
    metadata::FileQuery query_;
    std::string folder_;
    bool recursive_ = false;
    bool sameSampler_ = false;
    std::string sort_ = "mtime";
    bool ascending_ = false;
    int64_t page_ = 1;
    int64_t pageSize_ = 0;
};

std::unique_ptr<ICommand> createQueryCommand() {
    return std::make_unique<QueryCommand>();
}

} // namespace mediadex::cli
