#include "reporter.hpp"

namespace committer {

std::string success_line(const Invocation& inv) {
    const size_t n = inv.files.size();
    return "Committed \"" + inv.message + "\" with " + std::to_string(n) +
           (n == 1 ? " file" : " files");
}

int report_success(const Invocation& inv, std::ostream& out) {
    out << success_line(inv) << std::endl;
    return to_int(ExitCode::Success);
}

int report_error(const CommitterError& error, const std::string& prog, std::ostream& err) {
    const char* prefix = error.kind() == ErrorKind::NoChanges ? "Warning: " : "Error: ";
    err << prefix << error.what() << "\n";
    if (error.kind() == ErrorKind::Usage)
        err << "Run '" << prog << " --help' for usage.\n";
    err.flush();
    return to_int(error.exit_code());
}

int report_unexpected(const std::exception& error, std::ostream& err) {
    err << "Error: " << error.what() << std::endl;
    return to_int(ExitCode::Failure);
}

} // namespace committer
