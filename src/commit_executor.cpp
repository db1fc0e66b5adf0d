#include "commit_executor.hpp"
#include <string>
#include <utility>
#include "lock_utils.hpp"
#include "logger.hpp"

namespace committer {

namespace {

CommitAttempt attempt_commit(VcsEngine& engine, const Invocation& inv,
                             const std::string& lock_suffix) {
    CommitOutput raw = engine.commit(inv.message, inv.files);
    CommitAttempt attempt;
    attempt.exit_code = raw.exit_code;
    attempt.output = std::move(raw.output);
    if (!attempt.succeeded())
        attempt.lock_path = procutil::extract_lock_path(attempt.output, lock_suffix);
    log_info("Commit attempt finished", {{"exit_code", std::to_string(attempt.exit_code)},
                                         {"lock", attempt.lock_path.value_or("")}});
    return attempt;
}

} // namespace

CommitOutcome execute_commit(VcsEngine& engine, const Invocation& inv,
                             const std::string& lock_suffix, std::ostream& diag) {
    CommitOutcome outcome;
    outcome.attempts.push_back(attempt_commit(engine, inv, lock_suffix));
    const CommitAttempt& first = outcome.attempts.front();
    if (first.succeeded())
        return outcome;
    if (!inv.force_delete_lock) {
        if (first.lock_path)
            log_warning("Commit blocked by lock file; rerun with --force to remove it",
                        *first.lock_path);
        return outcome;
    }
    if (!first.lock_path) {
        log_debug("No lock file mentioned in commit output; not retrying");
        return outcome;
    }

    const std::string lock = *first.lock_path;
    if (!procutil::release_lock_file(lock)) {
        log_warning("Lock file missing or not removable; not retrying", lock);
        return outcome;
    }
    diag << "Removing stale lock file: " << lock << std::endl;
    log_info("Removed stale lock file", lock);
    outcome.removed_lock = lock;
    outcome.attempts.push_back(attempt_commit(engine, inv, lock_suffix));
    return outcome;
}

CommitError commit_failure(const CommitOutcome& outcome) {
    const CommitAttempt& last = outcome.last();
    for (const auto& line : last.output) {
        if (line.find_first_not_of(" \t") != std::string::npos)
            return CommitError("commit failed: " + line, last.exit_code);
    }
    return CommitError("commit failed with exit code " + std::to_string(last.exit_code),
                       last.exit_code);
}

} // namespace committer
