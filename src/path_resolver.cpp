#include "path_resolver.hpp"
#include <filesystem>
#include <system_error>
#include "errors.hpp"
#include "logger.hpp"

namespace committer {

const char* path_source_name(PathSource source) {
    switch (source) {
    case PathSource::WorkingTree:
        return "working-tree";
    case PathSource::TrackedIndex:
        return "index";
    case PathSource::LastCommit:
        return "HEAD";
    case PathSource::None:
        return "none";
    }
    return "none";
}

PathSource resolve_path(VcsEngine& engine, const std::string& path) {
    std::error_code ec;
    // symlink_status so a dangling symlink still counts as present.
    if (std::filesystem::exists(std::filesystem::symlink_status(path, ec)))
        return PathSource::WorkingTree;
    if (engine.path_in_index(path))
        return PathSource::TrackedIndex;
    if (engine.blob_in_commit("HEAD", path))
        return PathSource::LastCommit;
    return PathSource::None;
}

void ensure_paths_known(VcsEngine& engine, const std::vector<std::string>& files) {
    for (const auto& f : files) {
        PathSource src = resolve_path(engine, f);
        log_debug("Resolved path", {{"path", f}, {"source", path_source_name(src)}});
        if (src == PathSource::None)
            throw NotFoundError(f);
    }
}

} // namespace committer
