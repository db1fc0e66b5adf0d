#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar system
 * calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/** Outcome of a finished child process. */
struct ProcessResult {
    int exit_code = -1;  ///< Exit status, or 128 + signal number when killed.
    std::string output;  ///< Interleaved stdout and stderr.
};

/**
 * @brief Run a program and wait for it to finish.
 *
 * The program is looked up on `PATH`. Standard output and standard error are
 * captured together through a single pipe, standard input is `/dev/null`.
 * A program that cannot be executed exits with status 127.
 *
 * @param argv Program name followed by its arguments.
 * @param cwd  Working directory for the child; empty keeps the current one.
 * @return Exit status and combined output.
 * @throws std::system_error when the pipe or the child cannot be created.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::filesystem::path& cwd = {});

/**
 * @brief Split captured process output into lines without trailing `\r`.
 */
std::vector<std::string> split_lines(const std::string& text);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
