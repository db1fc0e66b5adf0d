#pragma once
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>
#include "system_utils.hpp"

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace committer::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/// Fresh, uniquely named directory under the system temp directory.
inline fs::path unique_temp_dir(const std::string& stem) {
    static std::atomic<int> counter{0};
    fs::path dir = fs::temp_directory_path() /
                   (stem + "_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

/// Changes the working directory for the lifetime of the guard.
struct CwdGuard {
    fs::path previous;
    explicit CwdGuard(const fs::path& dir) : previous(fs::current_path()) {
        fs::current_path(dir);
    }
    ~CwdGuard() {
        std::error_code ec;
        fs::current_path(previous, ec);
    }
    CwdGuard(const CwdGuard&) = delete;
    CwdGuard& operator=(const CwdGuard&) = delete;
};

/**
 * Throwaway repository created with the git executable. Removed on
 * destruction. Commits are made with a fixed identity and no signing.
 */
struct TempRepo {
    fs::path dir;

    explicit TempRepo(const std::string& stem = "committer_repo") : dir(unique_temp_dir(stem)) {
        git({"init", "-q"});
        git({"config", "user.name", "Committer Test"});
        git({"config", "user.email", "committer@example.com"});
        git({"config", "commit.gpgsign", "false"});
        git({"config", "core.hooksPath", "/dev/null"});
    }
    ~TempRepo() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    TempRepo(const TempRepo&) = delete;
    TempRepo& operator=(const TempRepo&) = delete;

    procutil::ProcessResult git(const std::vector<std::string>& args) const {
        std::vector<std::string> argv{"git"};
        argv.insert(argv.end(), args.begin(), args.end());
        return procutil::run_process(argv, dir);
    }

    /// Trimmed output of a git command expected to succeed.
    std::string git_out(const std::vector<std::string>& args) const {
        auto r = git(args);
        INFO("git " << (args.empty() ? std::string() : args.front()) << ": " << r.output);
        REQUIRE(r.exit_code == 0);
        std::string out = r.output;
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
            out.pop_back();
        return out;
    }

    void write(const std::string& rel, const std::string& content) const {
        write_file(dir / rel, content);
    }

    /// Stage and commit @a rel with the given content through the git executable.
    void commit_file(const std::string& rel, const std::string& content,
                     const std::string& message = "seed") const {
        write(rel, content);
        git_out({"add", "--", rel});
        git_out({"commit", "-q", "-m", message});
    }

    int commit_count() const {
        auto r = git({"rev-list", "--count", "HEAD"});
        if (r.exit_code != 0)
            return 0;
        return std::stoi(r.output);
    }

    /// Paths changed by the HEAD commit, one per element.
    std::vector<std::string> head_changes() const {
        std::string out = git_out({"show", "--pretty=format:", "--name-only", "HEAD"});
        std::vector<std::string> files;
        for (auto& line : procutil::split_lines(out)) {
            if (!line.empty())
                files.push_back(line);
        }
        return files;
    }

    std::string head_subject() const { return git_out({"log", "-1", "--pretty=%s"}); }

    /// Output of `git diff --cached --name-only`.
    std::string staged() const { return git_out({"diff", "--cached", "--name-only"}); }

    fs::path git_dir() const { return dir / ".git"; }

    std::string branch() const { return git_out({"symbolic-ref", "--short", "HEAD"}); }
};

} // namespace committer::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::committer::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::committer::test_support::remove_all((path))
#endif
