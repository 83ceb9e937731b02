#ifndef SEEDWISE_TIME_HEADER
#define SEEDWISE_TIME_HEADER

#include <chrono>
#include <cstdint>

#include <asio/steady_timer.hpp>

namespace seedwise {

using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using std::chrono::duration_cast;

using deadline_timer = asio::steady_timer;

template <typename Unit>
int64_t to_int(const duration& d)
{
    return duration_cast<Unit>(d).count();
}

inline duration elapsed_since(const time_point& t)
{
    return clock::now() - t;
}

template <typename Duration, typename Handler>
void start_timer(deadline_timer& timer, const Duration& expires_in, Handler handler)
{
    // Setting this cancels pending async waits (which is what we want).
    timer.expires_after(expires_in);
    timer.async_wait(std::move(handler));
}

} // namespace seedwise

#endif // SEEDWISE_TIME_HEADER
