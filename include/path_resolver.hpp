#ifndef PATH_RESOLVER_HPP
#define PATH_RESOLVER_HPP

#include <string>
#include <vector>
#include "vcs_engine.hpp"

namespace committer {

/** Where a requested path was first found, in lookup order. */
enum class PathSource { WorkingTree, TrackedIndex, LastCommit, None };

const char* path_source_name(PathSource source);

/**
 * @brief Decide whether @a path is known to the repository.
 *
 * Checks the filesystem first, then the index, then the tree of HEAD, and
 * stops at the first hit.
 */
PathSource resolve_path(VcsEngine& engine, const std::string& path);

/**
 * @brief Resolve every file in order and stop at the first unknown one.
 *
 * @throws NotFoundError naming the first path with PathSource::None.
 */
void ensure_paths_known(VcsEngine& engine, const std::vector<std::string>& files);

} // namespace committer

#endif // PATH_RESOLVER_HPP
