#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <ostream>

/**
 * @brief Print usage and the option table.
 *
 * @param prog Program name shown in the usage lines.
 * @param out  Stream receiving the text, normally standard output.
 */
void print_help(const char* prog, std::ostream& out);

#endif // HELP_TEXT_HPP
