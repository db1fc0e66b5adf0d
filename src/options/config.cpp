// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "errors.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_config_file(const std::string& path, bool json,
                             std::map<std::string, std::string>& cfg_opts) {
    std::string err;
    bool ok = json ? load_json_config(path, cfg_opts, err) : load_yaml_config(path, cfg_opts, err);
    if (!ok)
        throw committer::UsageError("Failed to load config " + path + ": " + err);
}

void load_config_and_auto(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                          fs::path& config_file) {
    for (const char* flag : {"--config-yaml", "--config-json"}) {
        if (!parser.has_flag(flag))
            continue;
        std::string cfg = parser.get_option(flag);
        if (cfg.empty())
            throw committer::UsageError(std::string(flag) + " requires a file");
        load_config_file(cfg, std::string(flag) == "--config-json", cfg_opts);
        config_file = cfg;
    }

    if (!parser.has_flag("--auto-config"))
        return;
    const fs::path dir = fs::current_path();
    for (const char* name : {".committer.yaml", ".committer.json"}) {
        fs::path candidate = dir / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            load_config_file(candidate.string(), candidate.extension() == ".json", cfg_opts);
            config_file = candidate;
            return;
        }
    }
}
