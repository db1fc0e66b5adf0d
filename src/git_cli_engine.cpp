#include "git_cli_engine.hpp"
#include <utility>
#include "errors.hpp"
#include "logger.hpp"

namespace committer {

namespace {

constexpr int kExecFailed = 127;

std::string first_line(const std::string& output) {
    auto lines = procutil::split_lines(output);
    for (const auto& l : lines) {
        if (!l.empty())
            return l;
    }
    return std::string();
}

[[noreturn]] void command_failed(const std::string& what, const procutil::ProcessResult& r) {
    std::string detail = r.exit_code == kExecFailed ? "cannot run git" : first_line(r.output);
    if (detail.empty())
        detail = "exit code " + std::to_string(r.exit_code);
    throw FatalError(what + ": " + detail);
}

} // namespace

GitCliEngine::GitCliEngine(std::string git_binary, std::filesystem::path cwd)
    : binary_(std::move(git_binary)), cwd_(std::move(cwd)) {}

procutil::ProcessResult GitCliEngine::git(const std::vector<std::string>& args) const {
    // File names are never globs: `a[1].txt` must not also match `a1.txt`.
    std::vector<std::string> argv{binary_, "--literal-pathspecs"};
    argv.insert(argv.end(), args.begin(), args.end());
    procutil::ProcessResult r = procutil::run_process(argv, cwd_);
    log_debug("git " + (args.empty() ? std::string() : args.front()),
              {{"exit_code", std::to_string(r.exit_code)}});
    return r;
}

bool GitCliEngine::head_unborn() const {
    auto r = git({"rev-parse", "-q", "--verify", "HEAD^{commit}"});
    if (r.exit_code == kExecFailed)
        command_failed("git rev-parse", r);
    return r.exit_code != 0;
}

bool GitCliEngine::path_in_index(const std::string& path) {
    auto r = git({"ls-files", "--error-unmatch", "--", path});
    if (r.exit_code == 0)
        return true;
    if (r.exit_code == 1)
        return false;
    command_failed("git ls-files", r);
}

bool GitCliEngine::blob_in_commit(const std::string& ref, const std::string& path) {
    // "<ref>:./<path>" is relative to the working directory, "<ref>:<path>" to the top level.
    std::filesystem::path p(path);
    std::string spec;
    if (p.is_absolute()) {
        auto top = git({"rev-parse", "--show-toplevel"});
        if (top.exit_code != 0)
            command_failed("git rev-parse", top);
        std::filesystem::path rel = p.lexically_normal().lexically_relative(first_line(top.output));
        spec = ref + ":" + rel.generic_string();
    } else {
        spec = ref + ":./" + p.generic_string();
    }
    auto r = git({"cat-file", "-e", spec});
    if (r.exit_code == kExecFailed)
        command_failed("git cat-file", r);
    return r.exit_code == 0;
}

void GitCliEngine::reset_index(const std::string& ref) {
    procutil::ProcessResult r;
    if (ref == "HEAD" && head_unborn())
        r = git({"read-tree", "--empty"});
    else
        r = git({"reset", "-q", ref, "--"});
    if (r.exit_code != 0)
        command_failed("cannot reset the index to " + ref, r);
}

void GitCliEngine::stage_paths(const std::vector<std::string>& paths) {
    std::vector<std::string> args{"add", "-A", "--"};
    args.insert(args.end(), paths.begin(), paths.end());
    auto r = git(args);
    if (r.exit_code != 0)
        command_failed("cannot stage files", r);
}

bool GitCliEngine::staged_diff_empty(const std::vector<std::string>& paths) {
    std::vector<std::string> args{"diff", "--cached", "--quiet", "--"};
    args.insert(args.end(), paths.begin(), paths.end());
    auto r = git(args);
    if (r.exit_code == 0)
        return true;
    if (r.exit_code == 1)
        return false;
    command_failed("git diff", r);
}

CommitOutput GitCliEngine::commit(const std::string& message,
                                  const std::vector<std::string>& paths) {
    std::vector<std::string> args{"commit", "-m", message, "--"};
    args.insert(args.end(), paths.begin(), paths.end());
    auto r = git(args);
    CommitOutput out;
    out.exit_code = r.exit_code;
    out.output = procutil::split_lines(r.output);
    return out;
}

} // namespace committer
