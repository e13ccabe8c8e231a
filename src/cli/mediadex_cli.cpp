#include <spdlog/spdlog.h>
#include <signal.h>
#include <cstring>
#include <iostream>
#include <mediadex/cli/mediadex_cli.h>
#include <mediadex/config/gallery_config.h>
#include <mediadex/config/logging.h>

namespace mediadex::cli {

namespace {

std::atomic<bool> g_shutdown{false};

extern "C" void handleSignal(int) {
    g_shutdown.store(true);
}

} // namespace

MediadexCLI::MediadexCLI() {
    app_ = std::make_unique<CLI::App>("Index AI-generated media and query generation metadata",
                                      "mediadex");
    app_->require_subcommand(1);
    app_->add_option("-c,--config", configPath_, "Configuration file");
    app_->add_option("--log-level", logLevel_, "trace, debug, info, warn or error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app_->add_flag("--compact", compact_, "Single-line JSON output");

    registerCommand(createSyncCommand());
    registerCommand(createQueryCommand());
    registerCommand(createSamplersCommand());
    registerCommand(createOptionsCommand());
    registerCommand(createStatsCommand());
    registerCommand(createFavoriteCommand());
    registerCommand(createRenameCommand());
    registerCommand(createMoveCommand());
    registerCommand(createDeleteCommand());
}

MediadexCLI::~MediadexCLI() {
    if (context_) {
        context_->shutdown();
    }
}

void MediadexCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

bool MediadexCLI::shutdownRequested() {
    return g_shutdown.load();
}

void MediadexCLI::requestShutdown() {
    g_shutdown.store(true);
}

void MediadexCLI::installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handleSignal;
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGINT handler");
    if (sigaction(SIGTERM, &sa, nullptr) == -1)
        spdlog::warn("Failed to install SIGTERM handler");
}

Result<app::GalleryContext*> MediadexCLI::context() {
    if (context_) {
        return context_.get();
    }

    auto loaded = config::loadGalleryConfig(configPath_);
    if (!loaded) {
        return loaded.error();
    }
    auto cfg = std::move(loaded).value();
    if (!logLevel_.empty()) {
        cfg.logging.level = logLevel_;
    }
    config::configureLogging(cfg.logging);

    auto created = app::GalleryContext::create(cfg);
    if (!created) {
        return created.error();
    }
    context_ = std::move(created).value();
    return context_.get();
}

void MediadexCLI::emit(const json& value) const {
    std::cout << (compact_ ? value.dump() : value.dump(2)) << "\n";
}

int MediadexCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (!logLevel_.empty()) {
        if (auto level = config::parseLogLevel(logLevel_)) {
            spdlog::set_level(*level);
        }
    }
    installSignalHandlers();

    int rc = 0;
    if (pending_) {
        try {
            auto result = pending_->execute();
            if (!result) {
                std::cerr << "Error: " << result.error().message << "\n";
                spdlog::error("{} failed: {}", pending_->getName(), result.error().message);
                rc = 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Unexpected error: " << e.what() << "\n";
            spdlog::error("Unexpected error: {}", e.what());
            rc = 1;
        }
    }

    if (context_) {
        context_->shutdown();
    }
    if (shutdownRequested()) {
        spdlog::info("Interrupted, shut down cleanly");
        rc = rc == 0 ? 130 : rc;
    }
    return rc;
}

} // namespace mediadex::cli
