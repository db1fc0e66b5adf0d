#include "commit_flow.hpp"
#include <exception>
#include "errors.hpp"
#include "git_cli_engine.hpp"
#include "git_engine.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "path_resolver.hpp"
#include "reporter.hpp"
#include "staging.hpp"
#include "version.hpp"

namespace committer {

namespace {

// Closes the log file and syslog on every exit path of run().
struct LoggerSession {
    LoggerSession() = default;
    LoggerSession(const LoggerSession&) = delete;
    LoggerSession& operator=(const LoggerSession&) = delete;
    ~LoggerSession() { shutdown_logger(); }
};

void setup_logging(const LoggingOptions& log) {
    set_log_level(log.log_level);
    set_json_logging(log.json_log);
    set_log_compression(log.compress_logs);
    if (!log.log_file.empty())
        init_logger(log.log_file, log.log_level, log.max_log_size, log.log_rotate);
    if (log.use_syslog)
        init_syslog(log.syslog_facility);
}

} // namespace

std::unique_ptr<VcsEngine> make_engine(const Options& opts) {
    if (opts.engine == EngineKind::Libgit2)
        return std::make_unique<git::Libgit2Engine>();
    return std::make_unique<GitCliEngine>(opts.git_binary);
}

CommitOutcome commit_files(VcsEngine& engine, const Invocation& inv,
                           const std::string& lock_suffix, std::ostream& diag) {
    ensure_paths_known(engine, inv.files);
    stage_files(engine, inv.files);
    log_info("Staged changes detected", join_paths(inv.files));
    CommitOutcome outcome = execute_commit(engine, inv, lock_suffix, diag);
    if (!outcome.succeeded())
        throw commit_failure(outcome);
    return outcome;
}

int run(int argc, char* argv[], std::ostream& out, std::ostream& err,
        const EngineFactory& factory) {
    const std::string prog = argc > 0 && argv[0] ? argv[0] : "committer";
    LoggerSession session;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(prog.c_str(), out);
            return to_int(ExitCode::Success);
        }
        if (opts.print_version) {
            out << COMMITTER_VERSION << "\n";
            return to_int(ExitCode::Success);
        }
        setup_logging(opts.logging);
        if (!opts.config_file.empty())
            log_debug("Loaded config", opts.config_file.string());
        for (const auto& key : opts.ignored_config_keys)
            log_warning("Ignoring unknown config key", key);

        Invocation inv = parse_invocation(opts.positional, opts.force_delete_lock);
        log_info("Commit requested", {{"message", inv.message},
                                      {"files", std::to_string(inv.files.size())},
                                      {"force", inv.force_delete_lock ? "true" : "false"},
                                      {"engine", engine_name(opts.engine)}});

        std::unique_ptr<VcsEngine> engine = factory(opts);
        CommitOutcome outcome = commit_files(*engine, inv, opts.lock_suffix, err);
        log_info("Commit created", {{"attempts", std::to_string(outcome.attempts.size())},
                                    {"files", join_paths(inv.files)}});
        return report_success(inv, out);
    } catch (const CommitterError& e) {
        log_error(e.what());
        return report_error(e, prog, err);
    } catch (const std::exception& e) {
        log_error(std::string("Unexpected error: ") + e.what());
        return report_unexpected(e, err);
    }
}

} // namespace committer
