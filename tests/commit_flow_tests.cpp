#include "test_common.hpp"
#include <sstream>
#include "commit_flow.hpp"
#include "fake_engine.hpp"
#include "logger.hpp"
#include "version.hpp"

using namespace committer;
using committer::test_support::CwdGuard;
using committer::test_support::EngineRef;
using committer::test_support::FakeEngine;
using committer::test_support::lock_failure;
using committer::test_support::read_file;
using committer::test_support::unique_temp_dir;
using committer::test_support::write_file;

namespace {

struct FlowResult {
    int code = -1;
    std::string out;
    std::string err;
};

/// Runs the whole command line against @a engine inside a scratch directory
/// containing a.txt and b.txt.
struct FlowFixture {
    fs::path dir = unique_temp_dir("committer_flow");
    FakeEngine engine;
    int factory_calls = 0;

    FlowFixture() {
        write_file(dir / "a.txt", "a");
        write_file(dir / "b.txt", "b");
    }
    ~FlowFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    FlowResult run(std::vector<std::string> args) {
        CwdGuard cwd(dir);
        args.insert(args.begin(), "committer");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        std::ostringstream out;
        std::ostringstream err;
        FlowResult r;
        r.code = committer::run(static_cast<int>(args.size()), argv.data(), out, err,
                                [this](const Options&) -> std::unique_ptr<VcsEngine> {
                                    ++factory_calls;
                                    return std::make_unique<EngineRef>(engine);
                                });
        r.out = out.str();
        r.err = err.str();
        return r;
    }
};

} // namespace

TEST_CASE("run commits a changed file") {
    FlowFixture f;
    FlowResult r = f.run({"fix: typo", "a.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"fix: typo\" with 1 file\n");
    REQUIRE(r.err.empty());
    REQUIRE(f.engine.calls ==
            std::vector<std::string>{"reset:HEAD", "stage:a.txt", "diff", "commit:fix: typo"});
}

TEST_CASE("run with several files reports the count") {
    FlowFixture f;
    FlowResult r = f.run({"--", "update", "a.txt", "b.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"update\" with 2 files\n");
}

TEST_CASE("run accepts a message that starts with a dash") {
    FlowFixture f;
    FlowResult r = f.run({"-WIP", "a.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"-WIP\" with 1 file\n");
    REQUIRE(f.engine.calls.back() == "commit:-WIP");
}

TEST_CASE("run accepts a dash message after --force") {
    FlowFixture f;
    FlowResult r = f.run({"--force", "--wip", "a.txt", "b.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"--wip\" with 2 files\n");
    REQUIRE(f.engine.calls.back() == "commit:--wip");
}

TEST_CASE("run usage errors touch nothing") {
    for (const auto& args : std::vector<std::vector<std::string>>{
             {}, {"only-message"}, {"--force"}, {"--force", "msg"}, {"--log-file"}}) {
        FlowFixture f;
        FlowResult r = f.run(args);
        INFO("args: " << args.size());
        REQUIRE(r.code == 2);
        REQUIRE(r.out.empty());
        REQUIRE(r.err.rfind("Error: ", 0) == 0);
        REQUIRE(r.err.find("Run 'committer --help' for usage.") != std::string::npos);
        REQUIRE(f.factory_calls == 0);
    }
}

TEST_CASE("run rejects an empty message before opening the repository") {
    FlowFixture f;
    FlowResult r = f.run({"", "a.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "Error: commit message must not be empty\n");
    REQUIRE(f.factory_calls == 0);
}

TEST_CASE("run rejects the dot path") {
    FlowFixture f;
    FlowResult r = f.run({"msg", "."});
    REQUIRE(r.code == 1);
    REQUIRE(r.err.rfind("Error: ", 0) == 0);
    REQUIRE(f.factory_calls == 0);
    REQUIRE_FALSE(f.engine.mutated());
}

TEST_CASE("run rejects a message that names an existing file") {
    FlowFixture f;
    FlowResult r = f.run({"a.txt", "b.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.err.find("a.txt") != std::string::npos);
    REQUIRE(f.factory_calls == 0);
}

TEST_CASE("run fails on an unknown file without staging") {
    FlowFixture f;
    FlowResult r = f.run({"msg", "a.txt", "missing.txt", "b.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "Error: file not found: missing.txt\n");
    REQUIRE_FALSE(f.engine.mutated());
}

TEST_CASE("run accepts deletions known to the index or HEAD") {
    FlowFixture f;
    f.engine.index_paths = {"gone-from-disk.txt"};
    f.engine.head_paths = {"gone-everywhere.txt"};
    FlowResult r = f.run({"remove files", "gone-from-disk.txt", "gone-everywhere.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"remove files\" with 2 files\n");
}

TEST_CASE("run warns when nothing changed") {
    FlowFixture f;
    f.engine.diff_empty = true;
    FlowResult r = f.run({"again", "a.txt", "b.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.out.empty());
    REQUIRE(r.err == "Warning: no staged changes detected for: a.txt b.txt\n");
    REQUIRE(f.engine.commit_calls == 0);
}

TEST_CASE("run with --force removes the stale lock and retries") {
    FlowFixture f;
    fs::path lock = f.dir / "index.lock";
    write_file(lock, "");
    f.engine.commit_results.push_back(lock_failure(lock.string()));
    FlowResult r = f.run({"--force", "fix", "a.txt"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Committed \"fix\" with 1 file\n");
    REQUIRE(r.err == "Removing stale lock file: " + lock.string() + "\n");
    REQUIRE(f.engine.commit_calls == 2);
    REQUIRE_FALSE(fs::exists(lock));
}

TEST_CASE("run without --force reports the lock failure") {
    FlowFixture f;
    fs::path lock = f.dir / "index.lock";
    write_file(lock, "");
    f.engine.commit_results.push_back(lock_failure(lock.string()));
    FlowResult r = f.run({"fix", "a.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "Error: commit failed: fatal: Unable to create '" + lock.string() +
                         "': File exists.\n");
    REQUIRE(f.engine.commit_calls == 1);
    REQUIRE(fs::exists(lock));
}

TEST_CASE("run honours a custom lock suffix") {
    FlowFixture f;
    fs::path lock = f.dir / "wlock";
    write_file(lock, "");
    f.engine.commit_results.push_back(CommitOutput{255, {"abort: '" + lock.string() + "' held"}});
    FlowResult r = f.run({"--force", "--lock-suffix", "wlock", "fix", "a.txt"});
    REQUIRE(r.code == 0);
    REQUIRE_FALSE(fs::exists(lock));
}

TEST_CASE("run reports engine failures") {
    FlowFixture f;
    f.engine.fail_stage = true;
    FlowResult r = f.run({"fix", "a.txt"});
    REQUIRE(r.code == 1);
    REQUIRE(r.err == "Error: cannot stage files: index locked\n");
}

TEST_CASE("run reports a factory failure") {
    fs::path dir = unique_temp_dir("committer_flow_norepo");
    write_file(dir / "a.txt", "a");
    std::ostringstream out;
    std::ostringstream err;
    int code = -1;
    {
        CwdGuard cwd(dir);
        const char* argv[] = {"committer", "fix", "a.txt", nullptr};
        code = committer::run(3, const_cast<char**>(argv), out, err,
                              [](const Options&) -> std::unique_ptr<VcsEngine> {
                                  throw FatalError("not a git repository");
                              });
    }
    FS_REMOVE_ALL(dir);
    REQUIRE(code == 1);
    REQUIRE(err.str() == "Error: not a git repository\n");
}

TEST_CASE("run prints the version") {
    FlowFixture f;
    FlowResult r = f.run({"--version"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == std::string(COMMITTER_VERSION) + "\n");
    REQUIRE(f.factory_calls == 0);
}

TEST_CASE("run shows help without validating arguments") {
    FlowFixture f;
    FlowResult r = f.run({"--help"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out.find("Usage: committer [options]") != std::string::npos);
    REQUIRE(r.out.find("--engine <git|libgit2>") != std::string::npos);
    REQUIRE(r.out.find("libgit2 skips commit hooks") != std::string::npos);
    REQUIRE(r.err.empty());
    REQUIRE(f.factory_calls == 0);
}

TEST_CASE("run writes the requested log file") {
    FlowFixture f;
    fs::path log = f.dir / "committer.log";
    FlowResult r = f.run({"--log-file", log.string(), "--verbose", "fix", "a.txt"});
    REQUIRE(r.code == 0);
    REQUIRE_FALSE(logger_initialized());
    std::string text = read_file(log);
    REQUIRE(text.find("Commit requested") != std::string::npos);
    REQUIRE(text.find("Resolved path") != std::string::npos);
    REQUIRE(text.find("Commit created") != std::string::npos);
    set_log_level(LogLevel::INFO);
}
