#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <mediadex/extraction/debug_sink.h>

namespace mediadex::extraction {

void DirectoryDebugSink::emit(const std::filesystem::path& sourceFile, std::string_view stage,
                              std::string_view info, std::string_view payload) {
    auto dir = root_ / sourceFile.stem();
    auto name = info.empty() ? fmt::format("{}.json", stage) : fmt::format("{}_{}.json", stage, info);

    // Pretty-print when the payload is JSON, otherwise keep it verbatim.
    auto parsed = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    std::string body = parsed.is_discarded() ? std::string(payload) : parsed.dump(2);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::debug("[DebugSink] cannot create {}: {}", dir.string(), ec.message());
        return;
    }
    std::ofstream out(dir / name, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::debug("[DebugSink] cannot write {}", (dir / name).string());
        return;
    }
    out << body;
}

std::shared_ptr<IDebugSink> makeDebugSink(const std::filesystem::path& debugDir) {
    if (debugDir.empty()) {
        return std::make_shared<NullDebugSink>();
    }
    return std::make_shared<DirectoryDebugSink>(debugDir);
}

} // namespace mediadex::extraction
