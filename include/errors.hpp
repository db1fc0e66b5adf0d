#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace committer {

/**
 * @brief Process exit statuses.
 *
 * `Usage` is kept apart from `Failure` so wrapper scripts can tell "called
 * wrongly" from "ran and failed" without scraping stderr.
 */
enum class ExitCode : int {
    Success = 0,
    Failure = 1,
    Usage = 2,
};

constexpr int to_int(ExitCode code) { return static_cast<int>(code); }

/** Error categories surfaced to the user. */
enum class ErrorKind { Usage, Validation, NotFound, NoChanges, Commit, Fatal };

/**
 * @brief Base class of every error the commit workflow reports.
 *
 * The message is the single human-readable line printed on stderr.
 */
class CommitterError : public std::runtime_error {
  public:
    CommitterError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    ExitCode exit_code() const {
        return kind_ == ErrorKind::Usage ? ExitCode::Usage : ExitCode::Failure;
    }

  private:
    ErrorKind kind_;
};

/** Malformed invocation: missing arguments, option without a value, bad option value. */
class UsageError : public CommitterError {
  public:
    explicit UsageError(const std::string& message) : CommitterError(ErrorKind::Usage, message) {}
};

/** Empty message, message naming an existing path, or a forbidden `.` file. */
class ValidationError : public CommitterError {
  public:
    explicit ValidationError(const std::string& message)
        : CommitterError(ErrorKind::Validation, message) {}
};

/** A requested file is unknown to the working tree, the index and HEAD. */
class NotFoundError : public CommitterError {
  public:
    explicit NotFoundError(const std::string& path)
        : CommitterError(ErrorKind::NotFound, "file not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

  private:
    std::string path_;
};

/** Staging the requested files produced no difference against HEAD. */
class NoChangesError : public CommitterError {
  public:
    explicit NoChangesError(const std::string& message)
        : CommitterError(ErrorKind::NoChanges, message) {}
};

/** The commit itself failed and lock recovery did not resolve it. */
class CommitError : public CommitterError {
  public:
    CommitError(const std::string& message, int exit_status)
        : CommitterError(ErrorKind::Commit, message), exit_status_(exit_status) {}

    /** Exit status reported by the version-control engine for the last attempt. */
    int engine_status() const { return exit_status_; }

  private:
    int exit_status_;
};

/** The version-control engine failed outside the commit step (open, reset, stage, diff). */
class FatalError : public CommitterError {
  public:
    explicit FatalError(const std::string& message) : CommitterError(ErrorKind::Fatal, message) {}
};

} // namespace committer

#endif // ERRORS_HPP
