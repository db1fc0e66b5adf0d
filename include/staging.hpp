#ifndef STAGING_HPP
#define STAGING_HPP

#include <string>
#include <vector>
#include "vcs_engine.hpp"

namespace committer {

struct StagingResult {
    bool has_changes = false;
};

/**
 * @brief Replace whatever is staged with exactly @a files.
 *
 * The index is reset to HEAD first so earlier partial staging cannot leak
 * into the commit, then @a files are staged (deletions included) and the
 * staged diff for them is checked.
 *
 * @return A result with `has_changes == true`.
 * @throws NoChangesError when staging @a files changed nothing.
 * @throws FatalError when the engine cannot reset or stage.
 */
StagingResult stage_files(VcsEngine& engine, const std::vector<std::string>& files);

/** @return Files joined with single spaces, as used in diagnostics. */
std::string join_paths(const std::vector<std::string>& files);

} // namespace committer

#endif // STAGING_HPP
