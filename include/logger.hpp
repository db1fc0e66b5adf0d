#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <optional>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and configures log rotation
 * parameters. Calling it again switches to the new file.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 *
 * @param level Desired @ref LogLevel threshold for emitting messages.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`).
 *
 * Matching is case-insensitive.
 *
 * @return The level or `std::nullopt` for an unknown name.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/**
 * @brief Compress rotated log files with gzip.
 */
void set_log_compression(bool enable);

/**
 * @brief Configure how many rotated log files are retained.
 *
 * @param max_files Number of historical log files to keep after rotation.
 */
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if the logger is ready to use; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * Messages are mirrored to syslog under the `committer` ident. No-op on
 * platforms without syslog.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Flush buffered log output to disk.
 */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
