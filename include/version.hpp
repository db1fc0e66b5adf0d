#ifndef VERSION_HPP
#define VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                     */
#define COMMITTER_VERSION_MAJOR 0
#define COMMITTER_VERSION_MINOR 3
#define COMMITTER_VERSION_PATCH 0

/*
 * Release tag injected by the packaging step.
 * Example format: "0.3.0" or "2025.07.31-1".
 */
#define COMMITTER_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* COMMITTER_VERSION = COMMITTER_VERSION_STR;

#endif // VERSION_HPP
