#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <mediadex/core/file_time.h>
#include <mediadex/crypto/hasher.h>
#include <mediadex/sync/folder_layout.h>

namespace mediadex::sync {

namespace fs = std::filesystem;

namespace {

double nowSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

double folderMtime(const fs::path& path) {
    std::error_code ec;
    double t = mtimeSeconds(path, ec);
    if (ec) {
        spdlog::warn("[FolderLayout] could not read mtime of {}: {}", path.string(), ec.message());
        return nowSeconds();
    }
    return t;
}

} // namespace

fs::path normalizedFolder(const fs::path& path) {
    auto normal = path.lexically_normal();
    if (normal.has_relative_path() && normal.filename().empty())
        normal = normal.parent_path();
    return normal;
}

const FolderInfo* FolderLayout::find(const std::string& key) const {
    auto it = std::find_if(folders.begin(), folders.end(),
                           [&](const FolderInfo& f) { return f.key == key; });
    return it == folders.end() ? nullptr : &*it;
}

const FolderInfo* FolderLayout::findByPath(const fs::path& path) const {
    auto normal = normalizedFolder(path);
    auto it = std::find_if(folders.begin(), folders.end(),
                           [&](const FolderInfo& f) { return f.path == normal; });
    return it == folders.end() ? nullptr : &*it;
}

FolderLayoutCache::FolderLayoutCache(fs::path root, std::vector<std::string> excludedNames)
    : root_(std::move(root)), excluded_(std::move(excludedNames)) {
    std::error_code ec;
    auto absolute = fs::absolute(root_, ec);
    if (!ec)
        root_ = normalizedFolder(absolute);
}

std::string FolderLayoutCache::keyFor(const std::string& relativePath) {
    if (relativePath.empty())
        return kRootFolderKey;
    return crypto::base64UrlEncode(relativePath);
}

Result<std::string> FolderLayoutCache::relativePathFor(const std::string& key) {
    if (key == kRootFolderKey)
        return std::string{};
    auto decoded = crypto::base64UrlDecode(key);
    if (!decoded)
        return Error{ErrorCode::InvalidArgument, "Invalid folder key: " + key};
    return decoded;
}

std::shared_ptr<const FolderLayout> FolderLayoutCache::get(bool forceRefresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!layout_ || forceRefresh)
        layout_ = scan();
    return layout_;
}

void FolderLayoutCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    layout_.reset();
}

std::shared_ptr<const FolderLayout> FolderLayoutCache::scan() const {
    spdlog::debug("[FolderLayout] scanning {}", root_.string());
    auto layout = std::make_shared<FolderLayout>();

    const fs::path rootPath = normalizedFolder(root_);
    FolderInfo rootInfo;
    rootInfo.key = kRootFolderKey;
    rootInfo.displayName = "Main";
    rootInfo.path = rootPath;
    rootInfo.mtime = folderMtime(root_);
    layout->folders.push_back(std::move(rootInfo));

    std::vector<FolderInfo> found;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("[FolderLayout] cannot scan {}: {}", root_.string(), ec.message());
        return layout;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("[FolderLayout] skipping unreadable entry under {}: {}", root_.string(),
                         ec.message());
            ec.clear();
            continue;
        }
        std::error_code dec;
        if (!it->is_directory(dec) || it->is_symlink(dec))
            continue;
        const auto name = it->path().filename().string();
        if (std::find(excluded_.begin(), excluded_.end(), name) != excluded_.end()) {
            it.disable_recursion_pending();
            continue;
        }

        FolderInfo info;
        info.path = it->path().lexically_normal();
        info.relativePath = info.path.lexically_relative(rootPath).generic_string();
        info.displayName = name;
        info.key = keyFor(info.relativePath);
        info.depth = static_cast<int>(
            std::count(info.relativePath.begin(), info.relativePath.end(), '/'));
        auto parentRel = fs::path(info.relativePath).parent_path().generic_string();
        info.parentKey = keyFor(parentRel);
        info.mtime = folderMtime(info.path);
        found.push_back(std::move(info));
    }

    std::stable_sort(found.begin(), found.end(), [](const FolderInfo& a, const FolderInfo& b) {
        if (a.depth != b.depth)
            return a.depth < b.depth;
        return a.relativePath < b.relativePath;
    });

    std::unordered_map<std::string, size_t> index{{kRootFolderKey, 0}};
    for (auto& info : found) {
        auto parent = index.find(*info.parentKey);
        if (parent != index.end())
            layout->folders[parent->second].children.push_back(info.key);
        index.emplace(info.key, layout->folders.size());
        layout->folders.push_back(std::move(info));
    }

    spdlog::debug("[FolderLayout] {} folders", layout->folders.size());
    return layout;
}

} // namespace mediadex::sync
