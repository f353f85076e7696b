/**
 * @file cpp_logger.h
 * @brief Queue-backed logging shared by every engine component.
 * @details Messages are formatted printf-style at the call site and queued in-process.
 *          The Python host drains the queue through `get_cpp_log_messages`, so log
 *          records end up in the host's own logging setup.
 */
#ifndef DANTEBRIDGE_CPP_LOGGER_H
#define DANTEBRIDGE_CPP_LOGGER_H

#include <atomic>
#include <string>
#include <tuple>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace dantebridge {
namespace engine {
namespace logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERR
};

/** @brief Messages below this level are discarded before formatting. */
extern std::atomic<LogLevel> current_log_level;

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string filename;   ///< Base name only.
    int line_number;
};

/**
 * @brief Takes up to 100 queued entries, waiting at most `timeout_ms` for the first.
 * @details Returns immediately with whatever is left once the logger is shut down.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/** @brief Stops accepting entries and wakes every waiting retriever. */
void shutdown_cpp_logger();

void set_cpp_log_level(LogLevel level);
LogLevel get_cpp_log_level();

/** @brief Also print each accepted entry to stderr (for runs without a host draining the queue). */
void set_cpp_log_stderr(bool enabled);

/** @brief Formats and queues one entry. Use the LOG_CPP_* macros instead. */
void log_message(LogLevel level, const char* file, int line, const char* format, ...);

/// Returns the part of `path` after the last '/' or '\\'.
const char* get_base_filename(const char* path);

/**
 * @brief Binds the logging controls to a Python module.
 * @details `get_cpp_log_messages` releases the GIL while it waits and returns
 *          (level, message, filename, line) tuples.
 */
inline void bind_logger(pybind11::module_ &m) {
    namespace py = pybind11;
    py::enum_<LogLevel>(m, "LogLevel_CPP")
        .value("DEBUG", LogLevel::DEBUG)
        .value("INFO", LogLevel::INFO)
        .value("WARNING", LogLevel::WARNING)
        .value("ERROR", LogLevel::ERR)
        .export_values();

    m.def("get_cpp_log_messages", [](int timeout_ms) {
        std::vector<LogEntry> drained;
        {
            py::gil_scoped_release release_gil;
            drained = retrieve_log_entries(timeout_ms);
        }
        std::vector<std::tuple<LogLevel, std::string, std::string, int>> rows;
        rows.reserve(drained.size());
        for (auto& entry : drained) {
            rows.emplace_back(entry.level, std::move(entry.message), std::move(entry.filename), entry.line_number);
        }
        return rows;
    }, py::arg("timeout_ms") = 100, "Drains queued engine log entries, waiting up to timeout_ms for the first.");

    m.def("shutdown_cpp_logger", &shutdown_cpp_logger, "Wakes pending log retrievals and stops queueing.");
    m.def("set_cpp_log_level", &set_cpp_log_level, py::arg("level"));
    m.def("get_cpp_log_level", &get_cpp_log_level);
    m.def("set_cpp_log_stderr", &set_cpp_log_stderr, py::arg("enabled"),
          "Mirrors accepted engine log entries to stderr.");
}

} // namespace logging
} // namespace engine
} // namespace dantebridge

#define LOG_CPP_BASE(level, fmt, ...) \
    dantebridge::engine::logging::log_message( \
        level, \
        dantebridge::engine::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(dantebridge::engine::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(dantebridge::engine::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(dantebridge::engine::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(dantebridge::engine::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // DANTEBRIDGE_CPP_LOGGER_H
