#include "staging.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace committer {

std::string join_paths(const std::vector<std::string>& files) {
    std::string out;
    for (const auto& f : files) {
        if (!out.empty())
            out += ' ';
        out += f;
    }
    return out;
}

StagingResult stage_files(VcsEngine& engine, const std::vector<std::string>& files) {
    engine.reset_index("HEAD");
    log_debug("Index reset to HEAD");
    engine.stage_paths(files);
    log_debug("Staged paths", join_paths(files));

    StagingResult result;
    result.has_changes = !engine.staged_diff_empty(files);
    if (!result.has_changes)
        throw NoChangesError("no staged changes detected for: " + join_paths(files));
    return result;
}

} // namespace committer
