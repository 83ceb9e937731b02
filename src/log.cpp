#include "log.hpp"

#include <fstream>
#include <mutex>
#ifdef SEEDWISE_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // SEEDWISE_ENABLE_STREAM_DEBUGGING

namespace seedwise {
namespace log {
namespace detail {

/** Engine, planner and executor run on the caller's thread only. */
class component_logger
{
    const char* name_;
    std::ofstream file_;

public:
    explicit component_logger(const char* name) : name_(name) {}
    void log(const std::string& header, const std::string& log,
            const priority priority = priority::normal);
};

/** The fetcher's jobs run on multiple threads so this logger is thread-safe. */
class fetcher_logger
{
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    void log(const std::string& header, const std::string& log, const bool concurrent,
            const priority priority);
};

// global logger instances

component_logger engine_logger("engine");
component_logger planner_logger("planner");
component_logger executor_logger("executor");
fetcher_logger fetcher_logger;

#ifndef SEEDWISE_MIN_LOG_PRIORITY
#define SEEDWISE_MIN_LOG_PRIORITY priority::low
#endif

#ifndef SEEDWISE_LOG_PATH
#define SEEDWISE_LOG_PATH "."
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

inline std::string make_log_path(const std::string& name)
{
    return std::string(SEEDWISE_LOG_PATH) + '/' + name + "-log.txt";
}

#ifdef SEEDWISE_ENABLE_LOGGING

#define SEEDWISE_PRIORITY_CHAR(p)                                                        \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define SEEDWISE_LOG(priority, stream, header, log)                                      \
    stream << '[' << SEEDWISE_PRIORITY_CHAR(priority) << '|' << header << "] " << log << '\n';

#ifdef SEEDWISE_ENABLE_STREAM_DEBUGGING
#define SEEDWISE_STREAM std::clog
#define SEEDWISE_CLOG(priority, file, header, log)                                       \
    do {                                                                                 \
        SEEDWISE_LOG(priority, file, header, log);                                       \
        SEEDWISE_LOG(priority, SEEDWISE_STREAM, header, log);                            \
    } while(0)
#else // SEEDWISE_ENABLE_STREAM_DEBUGGING
#define SEEDWISE_CLOG(p, f, h, l) SEEDWISE_LOG(p, f, h, l)
#endif // SEEDWISE_ENABLE_STREAM_DEBUGGING

#endif // SEEDWISE_ENABLE_LOGGING

void component_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef SEEDWISE_ENABLE_LOGGING
    if(priority < SEEDWISE_MIN_LOG_PRIORITY) {
        return;
    }
    if(!file_.is_open()) {
        file_.open(make_log_path(name_), g_open_mode);
    }
    SEEDWISE_CLOG(priority, file_, header, log);
#endif // SEEDWISE_ENABLE_LOGGING
}

void fetcher_logger::log(const std::string& header, const std::string& log,
        const bool concurrent, const priority priority)
{
#ifdef SEEDWISE_ENABLE_LOGGING
    if(priority < SEEDWISE_MIN_LOG_PRIORITY) {
        return;
    }
    // std::clog is only written from the caller's thread, pool threads would need
    // to serialize on it as well
#ifdef SEEDWISE_ENABLE_STREAM_DEBUGGING
    if(!concurrent) {
        SEEDWISE_LOG(priority, SEEDWISE_STREAM, header, log);
    }
#endif // SEEDWISE_ENABLE_STREAM_DEBUGGING
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path("fetcher"), g_open_mode);
    }
    SEEDWISE_LOG(priority, file_, header, log);
#endif // SEEDWISE_ENABLE_LOGGING
}

} // detail

void log_engine(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::engine_logger.log(header, log, priority);
}

void log_planner(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::planner_logger.log(header, log, priority);
}

void log_executor(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::executor_logger.log(header, log, priority);
}

void log_fetcher(const std::string& header, const std::string& log, const bool concurrent,
        const priority priority)
{
    detail::fetcher_logger.log(header, log, concurrent, priority);
}

} // log
} // seedwise
