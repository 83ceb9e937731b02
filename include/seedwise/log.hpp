#ifndef SEEDWISE_LOG_HEADER
#define SEEDWISE_LOG_HEADER

#include <string>

namespace seedwise {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

void log_engine(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_planner(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_executor(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
/** Fetches run on a thread pool, so this may be called from any thread. */
void log_fetcher(const std::string& header, const std::string& log,
        const bool concurrent = false, const priority priority = priority::normal);

} // log
} // seedwise

#endif // SEEDWISE_LOG_HEADER
