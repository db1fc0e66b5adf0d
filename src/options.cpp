#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

using committer::UsageError;

namespace {

const std::set<std::string> kBoolFlags{"--help",        "--version",     "--force",
                                       "--force-delete-lock",            "--verbose",
                                       "--json-log",    "--compress-logs", "--syslog",
                                       "--auto-config"};

const std::set<std::string> kValueFlags{"--engine",       "--git-binary",  "--lock-suffix",
                                        "--log-file",     "--log-level",   "--max-log-size",
                                        "--log-rotate",   "--syslog-facility",
                                        "--config-yaml",  "--config-json"};

const std::map<char, std::string> kShortOpts{{'h', "--help"},        {'V', "--version"},
                                             {'v', "--verbose"},     {'y', "--config-yaml"},
                                             {'j', "--config-json"}, {'L', "--log-level"},
                                             {'l', "--log-file"}};

// Keys accepted in config files. Lock removal and config loading itself are
// command line only.
const std::set<std::string> kConfigKeys{"--engine",        "--git-binary",   "--lock-suffix",
                                        "--log-file",      "--log-level",    "--verbose",
                                        "--json-log",      "--max-log-size", "--log-rotate",
                                        "--compress-logs", "--syslog",       "--syslog-facility"};

} // namespace

bool parse_engine_name(const std::string& name, EngineKind& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "libgit2") {
        out = EngineKind::Libgit2;
        return true;
    }
    if (v == "git" || v == "cli") {
        out = EngineKind::GitCli;
        return true;
    }
    return false;
}

const char* engine_name(EngineKind kind) {
    return kind == EngineKind::GitCli ? "git" : "libgit2";
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, kBoolFlags, kValueFlags, kShortOpts);
    if (!parser.missing_values().empty())
        throw UsageError("option " + parser.missing_values().front() + " requires a value");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.positional = parser.positional();
    if (opts.show_help || opts.print_version)
        return opts;

    std::map<std::string, std::string> cfg_opts;
    load_config_and_auto(parser, cfg_opts, opts.config_file);
    for (const auto& kv : cfg_opts) {
        if (kv.first == "--force" || kv.first == "--force-delete-lock")
            throw UsageError("lock removal cannot be enabled from a config file; pass --force");
        if (!kConfigKeys.count(kv.first))
            opts.ignored_config_keys.push_back(kv.first.substr(2));
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() && parse_flag_value(it->second);
    };
    // Command line value first, then config, then the empty string.
    auto value_of = [&](const std::string& k) -> std::string {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() ? it->second : std::string();
    };
    auto given = [&](const std::string& k) {
        return parser.has_flag(k) || cfg_opts.count(k) > 0;
    };

    opts.force_delete_lock = parser.has_flag("--force") || parser.has_flag("--force-delete-lock");

    if (given("--engine")) {
        std::string val = value_of("--engine");
        if (!parse_engine_name(val, opts.engine))
            throw UsageError("Invalid value for --engine: " + val);
    }
    if (given("--git-binary")) {
        opts.git_binary = value_of("--git-binary");
        if (opts.git_binary.empty())
            throw UsageError("--git-binary requires a path");
    }
    if (given("--lock-suffix")) {
        opts.lock_suffix = value_of("--lock-suffix");
        if (opts.lock_suffix.empty())
            throw UsageError("--lock-suffix must not be empty");
    }

    bool ok = false;
    LoggingOptions& log = opts.logging;
    log.log_file = value_of("--log-file");
    if (given("--log-level")) {
        std::string val = value_of("--log-level");
        auto lvl = parse_log_level(val);
        if (!lvl)
            throw UsageError("Invalid value for --log-level: " + val);
        log.log_level = *lvl;
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        log.log_level = LogLevel::DEBUG;
    log.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    log.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    if (given("--max-log-size")) {
        log.max_log_size = parse_bytes(value_of("--max-log-size"), 0, SIZE_MAX, ok);
        if (!ok)
            throw UsageError("Invalid value for --max-log-size");
    }
    if (given("--log-rotate")) {
        log.log_rotate = parse_size_t(value_of("--log-rotate"), 0, 1000, ok);
        if (!ok)
            throw UsageError("Invalid value for --log-rotate");
    }
    log.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    if (given("--syslog-facility")) {
        log.syslog_facility = parse_int(value_of("--syslog-facility"), 0, INT_MAX, ok);
        if (!ok)
            throw UsageError("Invalid value for --syslog-facility");
    }
    return opts;
}
