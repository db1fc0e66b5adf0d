#ifndef LOCK_UTILS_HPP
#define LOCK_UTILS_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace procutil {

/**
 * @brief Find the lock file a failed version-control command complained about.
 *
 * Scans @a lines in order for a path enclosed in single or double quotes that
 * ends with @a suffix, e.g. `Unable to create '/repo/.git/index.lock': File
 * exists.` The first match wins.
 *
 * @param lines  Combined output of the failed command.
 * @param suffix Lock file suffix, normally `.lock`.
 * @return The quoted path, or `std::nullopt` when no line mentions one.
 */
std::optional<std::string> extract_lock_path(const std::vector<std::string>& lines,
                                             const std::string& suffix = ".lock");

/**
 * @brief Delete a stale lock file.
 *
 * Only regular files (or symlinks) are removed; a directory with a lock-like
 * name is left alone.
 *
 * @param path Filesystem location of the lock file.
 * @return true if the file existed and was deleted.
 */
bool release_lock_file(const std::filesystem::path& path);

} // namespace procutil

#endif // LOCK_UTILS_HPP
