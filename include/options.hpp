#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "logger.hpp"

class ArgParser;

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t log_rotate = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

/** Version-control collaborator selected with `--engine`. */
enum class EngineKind { Libgit2, GitCli };

struct Options {
    LoggingOptions logging;
    EngineKind engine = EngineKind::GitCli;
    std::string git_binary = "git";
    std::string lock_suffix = ".lock";
    bool force_delete_lock = false;
    bool show_help = false;
    bool print_version = false;
    std::filesystem::path config_file;
    /// Config keys that were ignored; logged once the logger is up.
    std::vector<std::string> ignored_config_keys;
    /// Message and files, exactly as given after the options.
    std::vector<std::string> positional;
};

/**
 * @brief Parse command line options, merging in an optional config file.
 *
 * Options are read up to the first argument that is not a known option (or
 * `--`); that argument starts the message even when it begins with `-`. Values
 * given on the command line win over values from `--config-yaml`,
 * `--config-json` or `--auto-config`.
 *
 * @throws committer::UsageError for missing or invalid option values, unreadable config files and config files that try to
 *         enable lock removal.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Load the config file requested by @a parser into @a cfg_opts.
 *
 * Explicit `--config-yaml`/`--config-json` files are loaded in that order;
 * `--auto-config` then looks for `.committer.yaml` and `.committer.json` in
 * the current directory. @a config_file receives the last file loaded.
 *
 * @throws committer::UsageError when a file cannot be loaded.
 */
void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          std::filesystem::path& config_file);

/** @return Engine for a name accepted by `--engine`, case-insensitive. */
bool parse_engine_name(const std::string& name, EngineKind& out);

const char* engine_name(EngineKind kind);

#endif // OPTIONS_HPP
