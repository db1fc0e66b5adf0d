#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Leading-options command line parser.
 *
 * Options are only recognized before the first positional argument. The
 * first argument that is not a known option starts the positional list, and
 * it and everything after it are collected verbatim. A commit message such as
 * `-WIP` or `--wip` therefore lands in the positional list instead of being
 * rejected as an unknown option. A bare `--` ends option parsing explicitly.
 *
 * Long options take the form `--flag`, `--opt value` or `--opt=value`. Only
 * options listed in @a value_flags consume a value; every other known option
 * is a boolean flag. Short options (like `-v`) are mapped to their long form
 * through @a short_map and may be stacked (`-vh`); a short option that takes
 * a value accepts it attached (`-yfile`) or as the next argument. A short
 * group containing any unmapped letter is positional as a whole.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;          ///< Accepted boolean flags
    std::set<std::string> value_flags_;          ///< Accepted options that take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    bool is_known(const std::string& key) const {
        return known_flags_.count(key) > 0 || value_flags_.count(key) > 0;
    }

    // True when every letter of a `-abc` group maps to a known option.
    bool is_short_group(const std::string& arg) const {
        for (size_t j = 1; j < arg.size(); ++j) {
            auto it = short_map_.find(arg[j]);
            if (it == short_map_.end() || !is_known(it->second))
                return false;
            if (value_flags_.count(it->second))
                return true;
        }
        return true;
    }

    // Consume argv[i] as an option. Returns false when it is not one.
    bool take_option(int argc, char* argv[], int& i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            size_t eq = arg.find('=');
            std::string key = arg.substr(0, eq);
            if (!is_known(key))
                return false;
            if (eq != std::string::npos) {
                flags_.insert(key);
                options_[key] = arg.substr(eq + 1);
            } else if (!value_flags_.count(key)) {
                flags_.insert(key);
            } else if (i + 1 < argc) {
                flags_.insert(key);
                options_[key] = argv[++i];
            } else {
                missing_values_.push_back(key);
            }
            return true;
        }
        if (arg.size() < 2 || arg[0] != '-' || !is_short_group(arg))
            return false;
        for (size_t j = 1; j < arg.size(); ++j) {
            const std::string& key = short_map_.at(arg[j]);
            if (!value_flags_.count(key)) {
                flags_.insert(key);
                continue;
            }
            if (j + 1 < arg.size()) {
                flags_.insert(key);
                options_[key] = arg.substr(j + 1);
            } else if (i + 1 < argc) {
                flags_.insert(key);
                options_[key] = argv[++i];
            } else {
                missing_values_.push_back(key);
            }
            break;
        }
        return true;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Boolean flags that are considered valid.
     * @param value_flags Options that require a value.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        int i = 1;
        for (; i < argc; ++i) {
            if (std::string(argv[i]) == "--") {
                ++i;
                break;
            }
            if (!take_option(argc, argv, i))
                break;
        }
        for (; i < argc; ++i)
            positional_.push_back(argv[i]);
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Value options that appeared last on the line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
