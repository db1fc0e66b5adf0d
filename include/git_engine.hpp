#ifndef GIT_ENGINE_HPP
#define GIT_ENGINE_HPP

#include <git2.h>
#include <filesystem>
#include <string>
#include <vector>
#include "vcs_engine.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 keeps a reference count, so nested guards are fine.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using tree_entry_ptr = GitHandle<git_tree_entry, git_tree_entry_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using signature_ptr = GitHandle<git_signature, git_signature_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;

/**
 * @brief Message of the last libgit2 error on this thread.
 *
 * @return The message, or "Unknown libgit2 error" when libgit2 did not set one.
 */
std::string last_error_message();

/**
 * @brief In-process engine backed by libgit2.
 *
 * The repository is discovered from @a start upwards, the same way the git
 * command line finds it. Caller paths are interpreted relative to the current
 * directory and converted to repository paths; a path outside the working
 * tree is a committer::FatalError. Paths are matched literally, never as
 * globs; a directory covers the files below it.
 *
 * Commit hooks and commit signing are not run by this engine.
 *
 * commit() writes the index as a tree and creates the commit on `HEAD` with
 * the configured `user.name`/`user.email`. On failure its output is the
 * libgit2 error message, which quotes the lock file when a ref or the index
 * is locked.
 */
class Libgit2Engine : public committer::VcsEngine {
  public:
    /// @throws committer::FatalError when no non-bare repository is found.
    explicit Libgit2Engine(const fs::path& start = fs::current_path());

    std::string name() const override { return "libgit2"; }
    bool path_in_index(const std::string& path) override;
    bool blob_in_commit(const std::string& ref, const std::string& path) override;
    void reset_index(const std::string& ref) override;
    void stage_paths(const std::vector<std::string>& paths) override;
    bool staged_diff_empty(const std::vector<std::string>& paths) override;
    committer::CommitOutput commit(const std::string& message,
                                   const std::vector<std::string>& paths) override;

    /** @return Root of the working tree, without a trailing separator. */
    const fs::path& workdir() const { return workdir_; }

    /** @return @a path relative to workdir() in `/`-separated form. */
    std::string to_repo_path(const std::string& path) const;

  private:
    git_index* open_index() const;
    bool tracked(git_index* idx, const std::string& rel) const;
    git_tree* lookup_tree(const std::string& ref) const;
    bool head_unborn() const;

    GitInitGuard guard_;
    repo_ptr repo_;
    fs::path workdir_;
};

} // namespace git

#endif // GIT_ENGINE_HPP
