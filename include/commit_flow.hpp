#ifndef COMMIT_FLOW_HPP
#define COMMIT_FLOW_HPP

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include "commit_executor.hpp"
#include "invocation.hpp"
#include "options.hpp"
#include "vcs_engine.hpp"

namespace committer {

using EngineFactory = std::function<std::unique_ptr<VcsEngine>(const Options&)>;

/** @return The engine selected by `opts.engine`. */
std::unique_ptr<VcsEngine> make_engine(const Options& opts);

/**
 * @brief Resolve, stage and commit the files of @a inv.
 *
 * @throws NotFoundError, NoChangesError, CommitError or FatalError; nothing
 *         is staged before every path has been resolved.
 */
CommitOutcome commit_files(VcsEngine& engine, const Invocation& inv,
                           const std::string& lock_suffix, std::ostream& diag);

/**
 * @brief Full command line run: options, validation, commit and report.
 *
 * Writes the success line to @a out and every diagnostic to @a err. The
 * engine is only created once the invocation is valid.
 *
 * @return Process exit code (0, 1 or 2).
 */
int run(int argc, char* argv[], std::ostream& out, std::ostream& err,
        const EngineFactory& factory = make_engine);

} // namespace committer

#endif // COMMIT_FLOW_HPP
