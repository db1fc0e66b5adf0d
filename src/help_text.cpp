#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <ostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog, std::ostream& out) {
    static const std::vector<OptionInfo> opts = {
        {"--force", "", "", "Remove a stale lock file and retry the commit once", "Commit"},
        {"--force-delete-lock", "", "", "Alias for --force", "Commit"},
        {"--engine", "", "<git|libgit2>",
         "Version-control backend (default git); libgit2 skips commit hooks and signing",
         "Commit"},
        {"--git-binary", "", "<path>", "git executable used by --engine git", "Commit"},
        {"--lock-suffix", "", "<suffix>", "Lock file suffix to look for (default .lock)",
         "Commit"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .committer.yaml or .committer.json if present", "Config"},
        {"--log-file", "-l", "<path>", "Write a log file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-v", "", "Same as --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log file past this size", "Logging"},
        {"--log-rotate", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    out << "committer - commit an explicit list of files\n";
    out << "Stages exactly the named files and commits them under one message.\n\n";
    out << "Usage: " << prog << " [options] [--force] \"<message>\" <file> [<file> ...]\n";
    out << "       " << prog << " [options] -- \"<message>\" <file> [<file> ...]\n\n";
    const std::vector<std::string> order{"Commit", "Config", "Logging", "Basics"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        out << cat << ":\n";
        for (const auto* o : groups[cat]) {
            out << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                      << o->desc << "\n";
        }
        out << "\n";
    }
    out << "Exit status: 0 committed, 1 failed, 2 usage error.\n";
}
