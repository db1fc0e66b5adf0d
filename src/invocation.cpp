#include "invocation.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include "errors.hpp"

namespace committer {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool path_exists(const std::string& p) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::symlink_status(p, ec));
}

} // namespace

Invocation parse_invocation(const std::vector<std::string>& args, bool force) {
    if (args.empty())
        throw UsageError(force ? "--force needs a message and at least one file"
                               : "missing commit message and files");
    if (args.size() < 2)
        throw UsageError("no files given; list the files to commit after the message");

    Invocation inv;
    inv.force_delete_lock = force;
    inv.message = args.front();
    inv.files.assign(args.begin() + 1, args.end());
    if (inv.files.empty())
        throw UsageError("no files given; list the files to commit after the message");

    if (is_blank(inv.message))
        throw ValidationError("commit message must not be empty");
    // A message that names a file usually means the message was forgotten.
    if (path_exists(inv.message))
        throw ValidationError("commit message \"" + inv.message +
                              "\" is an existing path; did you forget the message?");
    for (const auto& f : inv.files) {
        if (f == ".")
            throw ValidationError("\".\" is not allowed; name the files to commit explicitly");
    }
    return inv;
}

} // namespace committer
