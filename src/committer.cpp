/**
 * @file committer.cpp
 * @brief CLI entry point: commit an explicit list of files.
 */

#include <iostream>

#include "commit_flow.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 when the commit was created or help/version was printed, 1 when
 *         validation, staging or the commit failed, 2 on usage errors.
 */
#ifndef COMMITTER_NO_MAIN
int main(int argc, char* argv[]) { return committer::run(argc, argv, std::cout, std::cerr); }
#endif // COMMITTER_NO_MAIN
