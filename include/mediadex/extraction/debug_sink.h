#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>

namespace mediadex::extraction {

/**
 * @brief Receives intermediate extraction artifacts for offline inspection
 */
class IDebugSink {
public:
    virtual ~IDebugSink() = default;

    virtual bool enabled() const = 0;

    /**
     * @param sourceFile media file the payload came from
     * @param stage ordered stage tag such as "01_raw"
     * @param info short qualifier appended to the artifact name
     * @param payload JSON or raw text
     */
    virtual void emit(const std::filesystem::path& sourceFile, std::string_view stage,
                      std::string_view info, std::string_view payload) = 0;
};

class NullDebugSink final : public IDebugSink {
public:
    bool enabled() const override { return false; }
    void emit(const std::filesystem::path&, std::string_view, std::string_view,
              std::string_view) override {}
};

/// Writes `<root>/<file stem>/<stage>_<info>.json`
class DirectoryDebugSink final : public IDebugSink {
public:
    explicit DirectoryDebugSink(std::filesystem::path root) : root_(std::move(root)) {}

    bool enabled() const override { return true; }
    void emit(const std::filesystem::path& sourceFile, std::string_view stage,
              std::string_view info, std::string_view payload) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::mutex mutex_;
};

std::shared_ptr<IDebugSink> makeDebugSink(const std::filesystem::path& debugDir);

} // namespace mediadex::extraction
