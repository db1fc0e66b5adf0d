#ifndef REPORTER_HPP
#define REPORTER_HPP

#include <exception>
#include <ostream>
#include <string>
#include "errors.hpp"
#include "invocation.hpp"

namespace committer {

/** @return `Committed "<message>" with <N> file(s)`. */
std::string success_line(const Invocation& inv);

/**
 * @brief Print the success line to @a out.
 * @return ExitCode::Success as an int.
 */
int report_success(const Invocation& inv, std::ostream& out);

/**
 * @brief Print the single error line for @a error to @a err.
 *
 * NoChangesError is printed as a warning. Usage errors get a hint pointing
 * at `--help`.
 *
 * @return The error's exit code as an int.
 */
int report_error(const CommitterError& error, const std::string& prog, std::ostream& err);

/** Report an exception from outside the error hierarchy; always a failure. */
int report_unexpected(const std::exception& error, std::ostream& err);

} // namespace committer

#endif // REPORTER_HPP
