#include "lock_utils.hpp"
#include <regex>
#include <system_error>

namespace procutil {

static std::string regex_escape(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos)
            out += '\\';
        out += c;
    }
    return out;
}

std::optional<std::string> extract_lock_path(const std::vector<std::string>& lines,
                                             const std::string& suffix) {
    if (suffix.empty())
        return std::nullopt;
    const std::regex pattern("['\"]([^'\"]+" + regex_escape(suffix) + ")['\"]");
    for (const auto& line : lines) {
        std::smatch m;
        if (std::regex_search(line, m, pattern))
            return m[1].str();
    }
    return std::nullopt;
}

bool release_lock_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto st = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(st) || std::filesystem::is_directory(st))
        return false;
    return std::filesystem::remove(path, ec) && !ec;
}

} // namespace procutil
