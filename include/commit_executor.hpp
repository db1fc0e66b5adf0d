#ifndef COMMIT_EXECUTOR_HPP
#define COMMIT_EXECUTOR_HPP

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "errors.hpp"
#include "invocation.hpp"
#include "vcs_engine.hpp"

namespace committer {

/** One run of the engine's commit operation. */
struct CommitAttempt {
    int exit_code = 0;
    std::vector<std::string> output;
    /// Lock file named in the output; only looked for when the attempt failed.
    std::optional<std::string> lock_path;

    bool succeeded() const { return exit_code == 0; }
};

/** Every attempt made for one invocation, at most two. */
struct CommitOutcome {
    std::vector<CommitAttempt> attempts;
    /// Lock file deleted between the attempts, if recovery fired.
    std::optional<std::string> removed_lock;

    bool succeeded() const { return !attempts.empty() && attempts.back().succeeded(); }
    const CommitAttempt& last() const { return attempts.back(); }
};

/**
 * @brief Commit with at most one retry after removing a stale lock.
 *
 * A failed first attempt is retried only when `inv.force_delete_lock` is set,
 * its output names a file ending in @a lock_suffix, and that file exists. The
 * lock is deleted and a notice written to @a diag before the second attempt.
 * The second attempt is final whatever it reports.
 */
CommitOutcome execute_commit(VcsEngine& engine, const Invocation& inv,
                             const std::string& lock_suffix, std::ostream& diag);

/**
 * @brief Turn a failed outcome into the error that gets reported.
 *
 * Uses the first non-empty output line of the last attempt.
 */
CommitError commit_failure(const CommitOutcome& outcome);

} // namespace committer

#endif // COMMIT_EXECUTOR_HPP
