#ifndef VCS_ENGINE_HPP
#define VCS_ENGINE_HPP

#include <string>
#include <vector>

namespace committer {

/** Raw outcome of one commit attempt as reported by the engine. */
struct CommitOutput {
    int exit_code = 0;
    /// Combined output lines; scanned for a lock path when the commit fails.
    std::vector<std::string> output;
};

/**
 * @brief Version-control operations the commit workflow depends on.
 *
 * Paths are given as the caller typed them, relative to the current
 * directory. Implementations throw committer::FatalError when an operation
 * other than commit() cannot be carried out. commit() reports failure through
 * its exit code so the caller can inspect the output for a stale lock.
 */
class VcsEngine {
  public:
    virtual ~VcsEngine() = default;

    /** @return Short engine name for logging. */
    virtual std::string name() const = 0;

    /** @return `true` when @a path (or any file below it) is tracked in the index. */
    virtual bool path_in_index(const std::string& path) = 0;

    /** @return `true` when @a ref resolves to a commit whose tree contains @a path. */
    virtual bool blob_in_commit(const std::string& ref, const std::string& path) = 0;

    /** Reset the whole index to the tree of @a ref, leaving the working tree alone. */
    virtual void reset_index(const std::string& ref) = 0;

    /** Stage additions, modifications and deletions for exactly @a paths. */
    virtual void stage_paths(const std::vector<std::string>& paths) = 0;

    /** @return `true` when the index matches HEAD for every path in @a paths. */
    virtual bool staged_diff_empty(const std::vector<std::string>& paths) = 0;

    /** Commit the staged state of @a paths with @a message. */
    virtual CommitOutput commit(const std::string& message,
                                const std::vector<std::string>& paths) = 0;
};

} // namespace committer

#endif // VCS_ENGINE_HPP
