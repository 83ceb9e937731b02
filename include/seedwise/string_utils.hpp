#ifndef SEEDWISE_STRING_UTILS_HEADER
#define SEEDWISE_STRING_UTILS_HEADER

#include <algorithm>
#include <cctype> // std::tolower
#include <cstdint>
#include <cstdio> // std::snprintf
#include <iterator> // std::begin, std::end
#include <memory> // std::unique_ptr
#include <string>

namespace seedwise {
namespace util {

template <typename String>
inline void to_lower(String& s)
{
    std::transform(std::begin(s), std::end(s), std::begin(s),
            [](const auto& c) { return std::tolower(static_cast<unsigned char>(c)); });
}

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

/** Formats a byte count with binary prefixes, e.g. 1536 -> "1.50 KiB". */
inline std::string format_size(const int64_t bytes)
{
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = bytes < 0 ? -double(bytes) : double(bytes);
    int unit = 0;
    while(value >= 1024.0 && unit < 5) {
        value /= 1024.0;
        ++unit;
    }
    if(unit == 0) {
        return format("%s%lld B", bytes < 0 ? "-" : "", static_cast<long long>(value));
    }
    return format("%s%.2f %s", bytes < 0 ? "-" : "", value, units[unit]);
}

} // namespace util
} // namespace seedwise

#endif // SEEDWISE_STRING_UTILS_HEADER
