#ifndef INVOCATION_HPP
#define INVOCATION_HPP

#include <string>
#include <vector>

namespace committer {

/** What to commit: built once per run and never modified. */
struct Invocation {
    std::string message;
    std::vector<std::string> files;
    bool force_delete_lock = false;
};

/**
 * @brief Build and validate an Invocation from the positional arguments.
 *
 * @param args  Message followed by the files, as left after option parsing.
 * @param force Whether `--force` was given.
 * @throws UsageError when the message or the file list is missing.
 * @throws ValidationError when the message is blank or names an existing
 *         path, or when a file argument is `.`.
 */
Invocation parse_invocation(const std::vector<std::string>& args, bool force);

} // namespace committer

#endif // INVOCATION_HPP
