#ifndef LUNAR_TRACE_COMMON_HPP
#define LUNAR_TRACE_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <memory>
#include <utility>

namespace lunar_trace {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    /// Local time with millisecond precision: "2026-02-16 12:00:00.000".
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto epoch = std::chrono::system_clock::to_time_t(time);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()) % 1000;

        std::tm tmBuf;
#if defined(_MSC_VER)
        localtime_s(&tmBuf, &epoch);
#else
        localtime_r(&epoch, &tmBuf);
#endif

        char buf[32];
        size_t pos = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf);
        if (pos == 0) {
            buf[0] = '\0';
        }
        std::snprintf(buf + pos, sizeof(buf) - pos, ".%03d",
                      static_cast<int>((ms.count() + 1000) % 1000));
        return std::string(buf);
    }
} // namespace detail
} // namespace lunar_trace

#endif // LUNAR_TRACE_COMMON_HPP
