#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <mediadex/app/gallery_service.h>

namespace mediadex::app {

namespace fs = std::filesystem;

namespace {

std::string scopeKey(const metadata::FolderScope& scope) {
    return scope.recursive ? scope.folder + "/**" : scope.folder;
}

Error fsError(const std::string& what, const std::error_code& ec) {
    auto code = ec == std::errc::permission_denied ? ErrorCode::PermissionDenied
                : ec == std::errc::no_such_file_or_directory ? ErrorCode::FileNotFound
                                                             : ErrorCode::IOError;
    return Error{code, what + ": " + ec.message()};
}

bool isWithin(const fs::path& root, const fs::path& candidate) {
    auto rel = candidate.lexically_normal().lexically_relative(root.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

GalleryService::GalleryService(metadata::IndexStore& store, sync::FolderLayoutCache& layout,
                               GalleryServiceConfig config)
    : store_(store), layout_(layout), filterCache_(config.filterOptionsCache),
      timingLog_(config.timingLog) {}

Result<metadata::Page> GalleryService::queryPage(const metadata::FileQuery& query,
                                                 const metadata::PageRequest& page) {
    return store_.queryPage(query, page);
}

Result<int64_t> GalleryService::countMatching(const metadata::FileQuery& query) {
    return store_.countMatching(query);
}

Result<metadata::FilterOptions> GalleryService::filterOptions(const metadata::FolderScope& scope) {
    const auto key = scopeKey(scope);
    if (auto cached = filterCache_.get(key)) {
        return std::move(*cached);
    }
    auto fresh = store_.filterOptions(scope);
    if (fresh) {
        filterCache_.set(key, fresh.value());
    }
    return fresh;
}

Result<std::optional<metadata::FileRecord>> GalleryService::getFile(const FileId& id) {
    return store_.getFile(id);
}

Result<extraction::SamplerRecords> GalleryService::getSamplers(const FileId& id) {
    return store_.getSamplers(id);
}

Result<metadata::IndexStats> GalleryService::stats() {
    return store_.stats();
}

void GalleryService::invalidateCaches() {
    filterCache_.clear();
}

void GalleryService::recordTiming(const std::string& endpoint,
                                  std::chrono::duration<double, std::milli> took) {
    auto now = std::chrono::system_clock::now();
    timingLog_.set(fmt::format("{}_{}", endpoint, timingSequence_.fetch_add(1)),
                   RequestTiming{endpoint, took.count(), now});
}

Result<int64_t> GalleryService::markFavorite(const std::vector<FileId>& ids, bool favorite) {
    auto updated = store_.setFavorite(ids, favorite);
    if (updated) {
        invalidateCaches();
    }
    return updated;
}

Result<std::string> GalleryService::resolveNewName(const std::string& oldName,
                                                   const std::string& requested) {
    std::string name = requested;
    auto begin = name.find_first_not_of(" \t\r\n");
    auto end = name.find_last_not_of(" \t\r\n");
    name = begin == std::string::npos ? std::string{} : name.substr(begin, end - begin + 1);

    if (name.empty() || name.size() > 250) {
        return Error{ErrorCode::InvalidArgument, "The provided filename is invalid or too long"};
    }
    if (name.find_first_of("\\/:\"*?<>|") != std::string::npos ||
        name.find("..") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Filename contains invalid characters"};
    }
    if (!fs::path(name).has_extension()) {
        name += fs::path(oldName).extension().string();
    }
    if (name == oldName) {
        return Error{ErrorCode::InvalidArgument, "The new name is the same as the old one"};
    }
    return name;
}

fs::path GalleryService::uniqueDestination(const fs::path& folder, const std::string& filename) {
    auto candidate = folder / filename;
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }
    const auto stem = fs::path(filename).stem().string();
    const auto ext = fs::path(filename).extension().string();
    for (int n = 1;; ++n) {
        candidate = folder / fmt::format("{}({}){}", stem, n, ext);
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

Result<void> GalleryService::moveOnDisk(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return fsError("Cannot move " + from.string(), ec);
    }

    // Different filesystem: copy, then remove the source
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return fsError("Cannot copy " + from.string(), ec);
    }
    fs::remove(from, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(to, cleanup);
        return fsError("Cannot remove " + from.string() + " after copy", ec);
    }
    return {};
}

Result<metadata::FileRecord> GalleryService::renamePath(const FileId& id,
                                                        const std::string& newName) {
    auto found = store_.getFile(id);
    if (!found) {
        return found.error();
    }
    if (!found.value()) {
        return Error{ErrorCode::NotFound, "File not found in the index: " + id};
    }
    const auto record = *found.value();

    auto finalName = resolveNewName(record.name, newName);
    if (!finalName) {
        return finalName.error();
    }

    const fs::path oldPath(record.path);
    const fs::path newPath = oldPath.parent_path() / finalName.value();
    if (!isWithin(layout_.root(), newPath)) {
        return Error{ErrorCode::InvalidArgument, "Invalid file location: " + newPath.string()};
    }

    std::error_code ec;
    if (fs::exists(newPath, ec)) {
        return Error{ErrorCode::AlreadyExists,
                     "A file named \"" + finalName.value() + "\" already exists in this folder"};
    }

    fs::rename(oldPath, newPath, ec);
    if (ec) {
        spdlog::error("[Gallery] rename {} failed: {}", oldPath.string(), ec.message());
        return fsError("Cannot rename " + oldPath.string(), ec);
    }

    auto relocated = store_.relocate(id, newPath.string());
    if (!relocated) {
        std::error_code revert;
        fs::rename(newPath, oldPath, revert);
        if (revert) {
            spdlog::error("[Gallery] could not undo rename of {}: {}", oldPath.string(),
                          revert.message());
        }
        return relocated.error();
    }

    invalidateCaches();
    spdlog::info("[Gallery] renamed {} -> {}", oldPath.filename().string(), finalName.value());
    return relocated;
}

Result<MutationReport> GalleryService::movePath(const std::vector<FileId>& ids,
                                                const fs::path& destFolder) {
    std::error_code ec;
    if (!fs::is_directory(destFolder, ec)) {
        return Error{ErrorCode::InvalidArgument, "Destination is not a folder: " + destFolder.string()};
    }
    const auto dest = sync::normalizedFolder(fs::absolute(destFolder, ec));
    if (ec || (dest != layout_.root() && !isWithin(layout_.root(), dest))) {
        return Error{ErrorCode::InvalidArgument,
                     "Destination is outside the gallery: " + destFolder.string()};
    }

    MutationReport report;
    for (const auto& id : ids) {
        auto found = store_.getFile(id);
        if (!found) {
            return found.error();
        }
        if (!found.value()) {
            report.failed.emplace_back(id, "not found in the index");
            continue;
        }
        const auto record = *found.value();
        const fs::path source(record.path);

        if (!fs::exists(source, ec)) {
            auto removed = store_.deleteById({id});
            if (!removed) {
                return removed.error();
            }
            report.failed.emplace_back(id, "not found on disk");
            continue;
        }
        if (source.parent_path() == dest) {
            report.succeeded.push_back(id);
            continue;
        }

        auto target = uniqueDestination(dest, record.name);
        auto moved = moveOnDisk(source, target);
        if (!moved) {
            spdlog::error("[Gallery] move {} failed: {}", record.name, moved.error().message);
            report.failed.emplace_back(id, moved.error().message);
            continue;
        }

        auto relocated = store_.relocate(id, target.string());
        if (!relocated) {
            auto undo = moveOnDisk(target, source);
            if (!undo) {
                spdlog::error("[Gallery] could not undo move of {}: {}", record.name,
                              undo.error().message);
            }
            report.failed.emplace_back(id, relocated.error().message);
            continue;
        }
        if (target.filename().string() != record.name) {
            ++report.renamed;
        }
        report.succeeded.push_back(relocated.value().id);
    }

    invalidateCaches();
    layout_.invalidate();
    spdlog::info("[Gallery] moved {} file(s), {} renamed, {} failed", report.succeeded.size(),
                 report.renamed, report.failed.size());
    return report;
}

Result<MutationReport> GalleryService::deletePath(const std::vector<FileId>& ids) {
    MutationReport report;
    std::vector<FileId> removable;

    for (const auto& id : ids) {
        auto found = store_.getFile(id);
        if (!found) {
            return found.error();
        }
        if (!found.value()) {
            report.failed.emplace_back(id, "not found in the index");
            continue;
        }
        const auto& record = *found.value();

        std::error_code ec;
        fs::remove(record.path, ec);
        if (ec) {
            spdlog::error("[Gallery] could not delete {}: {}", record.path, ec.message());
            report.failed.emplace_back(id, ec.message());
            continue;
        }
        if (record.thumbnailPath) {
            std::error_code tec;
            fs::remove(*record.thumbnailPath, tec);
            if (tec) {
                spdlog::warn("[Gallery] could not remove thumbnail {}: {}", *record.thumbnailPath,
                             tec.message());
            }
        }
        removable.push_back(id);
    }

    if (!removable.empty()) {
        auto deleted = store_.deleteById(removable);
        if (!deleted) {
            return deleted.error();
        }
    }
    report.succeeded = std::move(removable);
    invalidateCaches();
    return report;
}

} // namespace mediadex::app
