/**
 * @file cpp_logger.h
 * @brief Defines the logging framework for the airlift audio engine.
 * @details Log messages are queued in-process and drained by the Python layer.
 *          Provides log levels, the log entry structure and the `LOG_CPP_*` macros.
 */
#ifndef AIRLIFT_CPP_LOGGER_H
#define AIRLIFT_CPP_LOGGER_H

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <tuple>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace airlift {
namespace audio {
namespace logging {

/**
 * @enum LogLevel
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed diagnostics.
    INFO,    ///< Normal lifecycle messages.
    WARNING, ///< Something unexpected that the engine recovered from.
    ERR      ///< A component could not perform a function.
};

/** @brief Messages below this level are discarded before queueing. */
extern std::atomic<LogLevel> current_log_level;

/**
 * @struct LogEntry
 * @brief A single queued log message.
 */
struct LogEntry {
    LogLevel level;         ///< Severity.
    std::string message;    ///< Formatted message text.
    std::string filename;   ///< Base name of the emitting source file.
    int line_number;        ///< Line in the emitting source file.
};

/**
 * @brief Retrieves buffered log entries.
 * @details Blocks until entries are available, shutdown is requested or the
 *          timeout expires. Returns at most 100 entries per call.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return The retrieved entries, oldest first.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the logger to prepare for shutdown.
 * @details Unblocks any thread waiting in `retrieve_log_entries`.
 */
void shutdown_cpp_logger();

/**
 * @brief Sets the global log level.
 * @param level Messages below this level are ignored.
 */
void set_cpp_log_level(LogLevel level);

/**
 * @brief Formats a printf-style message and appends it to the queue.
 * @param level The log level.
 * @param file The source file name.
 * @param line The source line number.
 * @param format The printf-style format string.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

/**
 * @brief Returns the base filename of a path.
 * @param path The full path.
 * @return A pointer into `path` just past the last separator.
 */
const char* get_base_filename(const char* path);

/**
 * @brief Binds the logging functions to a Python module.
 * @param m The pybind11 module.
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
        std::vector<std::tuple<LogLevel, std::string, std::string, int>> entries_tuples;
        std::vector<LogEntry> cpp_entries;
        {
            py::gil_scoped_release release_gil;
            cpp_entries = retrieve_log_entries(timeout_ms);
        }
        entries_tuples.reserve(cpp_entries.size());
        for (const auto& entry : cpp_entries) {
            entries_tuples.emplace_back(entry.level, entry.message, entry.filename, entry.line_number);
        }
        return entries_tuples;
    }, py::arg("timeout_ms") = 100,
       "Retrieves buffered C++ log messages as (level, message, filename, line) tuples.");

    m.def("shutdown_cpp_logger", &shutdown_cpp_logger,
          "Unblocks any waiting log retrieval call.");

    m.def("set_cpp_log_level", &set_cpp_log_level, py::arg("level"),
          "Sets the C++ global log level.");
}

} // namespace logging
} // namespace audio
} // namespace airlift

/** @brief Base logging macro. Use the level-specific macros below. */
#define LOG_CPP_BASE(level, fmt, ...) \
    airlift::audio::logging::log_message( \
        level, \
        airlift::audio::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

#define LOG_CPP_DEBUG(fmt, ...)   LOG_CPP_BASE(airlift::audio::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_CPP_INFO(fmt, ...)    LOG_CPP_BASE(airlift::audio::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_CPP_WARNING(fmt, ...) LOG_CPP_BASE(airlift::audio::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_CPP_ERROR(fmt, ...)   LOG_CPP_BASE(airlift::audio::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // AIRLIFT_CPP_LOGGER_H
