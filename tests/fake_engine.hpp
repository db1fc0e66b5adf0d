#pragma once
#include <deque>
#include <fstream>
#include <set>
#include <string>
#include <vector>
#include "errors.hpp"
#include "vcs_engine.hpp"

namespace committer::test_support {

/**
 * In-memory VcsEngine. Tracked paths and HEAD contents are plain sets; every
 * call is recorded in `calls` so tests can check what the workflow did and in
 * which order.
 */
class FakeEngine : public VcsEngine {
  public:
    std::set<std::string> index_paths;
    std::set<std::string> head_paths;
    bool diff_empty = false;
    bool fail_stage = false;
    /// Results handed out by commit() in order; success once exhausted.
    std::deque<CommitOutput> commit_results;
    std::vector<std::string> calls;
    int commit_calls = 0;
    /// When set, every commit() creates this file, like a competing process would.
    std::string recreate_lock;

    std::string name() const override { return "fake"; }

    bool path_in_index(const std::string& path) override {
        calls.push_back("index:" + path);
        return index_paths.count(path) > 0;
    }

    bool blob_in_commit(const std::string& ref, const std::string& path) override {
        calls.push_back("blob:" + ref + ":" + path);
        return head_paths.count(path) > 0;
    }

    void reset_index(const std::string& ref) override { calls.push_back("reset:" + ref); }

    void stage_paths(const std::vector<std::string>& paths) override {
        std::string joined;
        for (const auto& p : paths)
            joined += (joined.empty() ? "" : " ") + p;
        calls.push_back("stage:" + joined);
        if (fail_stage)
            throw FatalError("cannot stage files: index locked");
    }

    bool staged_diff_empty(const std::vector<std::string>&) override {
        calls.push_back("diff");
        return diff_empty;
    }

    CommitOutput commit(const std::string& message, const std::vector<std::string>&) override {
        calls.push_back("commit:" + message);
        ++commit_calls;
        if (!recreate_lock.empty())
            std::ofstream(recreate_lock).flush();
        if (commit_results.empty())
            return CommitOutput{0, {"[main 1234567] " + message}};
        CommitOutput out = commit_results.front();
        commit_results.pop_front();
        return out;
    }

    /// True when reset, stage or commit was called.
    bool mutated() const {
        for (const auto& c : calls) {
            if (c.rfind("reset:", 0) == 0 || c.rfind("stage:", 0) == 0 ||
                c.rfind("commit:", 0) == 0)
                return true;
        }
        return false;
    }
};

/// Forwards to an engine the test keeps ownership of.
class EngineRef : public VcsEngine {
  public:
    explicit EngineRef(VcsEngine& target) : target_(target) {}
    std::string name() const override { return target_.name(); }
    bool path_in_index(const std::string& path) override { return target_.path_in_index(path); }
    bool blob_in_commit(const std::string& ref, const std::string& path) override {
        return target_.blob_in_commit(ref, path);
    }
    void reset_index(const std::string& ref) override { target_.reset_index(ref); }
    void stage_paths(const std::vector<std::string>& paths) override {
        target_.stage_paths(paths);
    }
    bool staged_diff_empty(const std::vector<std::string>& paths) override {
        return target_.staged_diff_empty(paths);
    }
    CommitOutput commit(const std::string& message,
                        const std::vector<std::string>& paths) override {
        return target_.commit(message, paths);
    }

  private:
    VcsEngine& target_;
};

inline CommitOutput lock_failure(const std::string& lock_path) {
    return CommitOutput{128,
                        {"fatal: Unable to create '" + lock_path + "': File exists.", "",
                         "Another git process seems to be running in this repository."}};
}

} // namespace committer::test_support
