#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
#ifdef __linux__
static std::atomic<bool> g_syslog{false};
#endif
static std::mutex g_log_mtx;
static const std::map<std::string, std::string> kNoFields;

/**
 * @brief Initialize file-based logging.
 *
 * Opens @p path for append, sets the minimum @ref LogLevel, and
 * configures size-based log rotation. When the file cannot be opened the
 * previous log file (if any) stays active.
 */
void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    } else {
        g_log_ofs.clear();
    }
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (facility == 0)
        facility = LOG_USER;
    g_syslog.store(true);
    openlog("committer", LOG_PID | LOG_CONS, facility);
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        return LogLevel::DEBUG;
    if (val == "INFO")
        return LogLevel::INFO;
    if (val == "WARNING" || val == "WARN")
        return LogLevel::WARNING;
    if (val == "ERROR")
        return LogLevel::ERR;
    return std::nullopt;
}

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_log_rotation(size_t max_files) { g_max_files.store(max_files); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static std::string format_extra_json(const std::map<std::string, std::string>& fields) {
    std::string out;
    bool first = true;
    for (const auto& [k, v] : fields) {
        if (!first)
            out += ",";
        out += "\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        first = false;
    }
    return out;
}

// Shift log.N -> log.N+1, drop the oldest, then move the active file to log.1.
// Caller holds g_log_mtx and has closed g_log_ofs.
static void rotate_log_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    for (size_t i = keep; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == keep) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs.load()) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

/**
 * @brief Core logging routine.
 *
 * Formats the message, writes it to the file sink, rotates when the size
 * limit is exceeded and optionally forwards it to syslog.
 */
static void write_log_entry(LogLevel level, const std::string& label, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (level < g_min_level.load())
        return;
    std::string line;
    std::string ts = timestamp();
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(ts) + "\",\"level\":\"" + label + "\",\"msg\":\"" +
               json_escape(msg) + "\"";
        if (!fields.empty())
            line += "," + format_extra_json(fields);
        line += "}";
    } else {
        line = "[" + ts + "] [" + label + "] " + msg;
        for (const auto& [k, v] : fields)
            line += " " + k + "=" + v;
    }
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
        if (g_max_size.load() > 0) {
            std::error_code ec;
            auto size = fs::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load()) {
                g_log_ofs.close();
                if (g_max_files.load() > 0)
                    rotate_log_files();
                g_log_ofs.open(g_log_path, std::ios::trunc);
            }
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static void log(LogLevel level, const std::string& msg,
                const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    write_log_entry(level, level_label(level), msg, fields);
}

static void log(LogLevel level, const std::string& msg, const std::string& data) {
    if (data.empty())
        log(level, msg, kNoFields);
    else
        log(level, msg, std::map<std::string, std::string>{{"data", data}});
}

void log_event(LogLevel level, const std::string& message) { log(level, message, kNoFields); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    log(level, message, fields);
}

void log_debug(const std::string& msg) { log(LogLevel::DEBUG, msg, kNoFields); }
void log_debug(const std::string& msg, const std::string& data) {
    log(LogLevel::DEBUG, msg, data);
}
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { log(LogLevel::INFO, msg, kNoFields); }
void log_info(const std::string& msg, const std::string& data) { log(LogLevel::INFO, msg, data); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { log(LogLevel::WARNING, msg, kNoFields); }
void log_warning(const std::string& msg, const std::string& data) {
    log(LogLevel::WARNING, msg, data);
}
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { log(LogLevel::ERR, msg, kNoFields); }
void log_error(const std::string& msg, const std::string& data) { log(LogLevel::ERR, msg, data); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
}
