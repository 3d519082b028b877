// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A dedicated background thread drains a queue so that session coroutines
// never block on stderr. Provides:
//  - Level filtering via ARENA_LOG_LEVEL (trace|debug|info|warn|error) or set_level()
//  - JSON line mode via ARENA_LOG_JSON presence or set_json()
//  - Instance prefix via ARENA_LOG_APP_ID (several proxies sharing one sink)
//  - flush() to wait for the queue to drain (tests, shutdown paths)

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace arena::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {
struct item
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::atomic<bool> g_app_id_enabled{false};
inline std::string g_app_id; // guarded by g_io_mtx
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::condition_variable g_drained_cv;
inline std::deque<item> g_queue;
inline size_t g_in_flight{0}; // guarded by g_q_mtx
inline std::mutex g_io_mtx;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline char level_tag(level lv)
{
    switch (lv) {
        case level::trace:
            return 'T';
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
}

inline void json_escape(std::ostream &os, std::string_view s)
{
    for (char c : s) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
        }
    }
}
} // namespace detail

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return level::trace;
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

// Formatting helpers are outside detail to be visible to variadic logging wrappers.
namespace detail_format {
template <typename T>
inline std::string to_string_any(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_arithmetic_v<D>) {
        if constexpr (std::is_floating_point_v<D>) {
            std::ostringstream oss;
            oss.setf(std::ios::fixed, std::ios::floatfield);
            oss.precision(3);
            oss << v;
            return oss.str();
        } else
            return std::to_string(v);
    } else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        constexpr size_t N = sizeof...(Args);
        std::array<std::string, N> values{to_string_any(std::forward<Args>(args))...};
        std::string out;
        out.reserve(fmt.size() + N * 8);
        size_t search_pos = 0;
        size_t idx = 0;
        while (idx < N) {
            size_t p = fmt.find("{}", search_pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(search_pos, p - search_pos));
            out += values[idx++];
            search_pos = p + 2;
        }
        out.append(fmt.substr(search_pos));
        // surplus arguments are appended space-separated
        for (; idx < N; ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}
} // namespace detail_format

namespace detail {
inline void format_and_write(level lv, const std::string &m, std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&tt, &tm);
    {
        std::lock_guard lk(g_io_mtx);
        if (g_json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
                      << std::setfill('0') << ms << std::setfill(' ') << "\",\"level\":\"" << level_name(lv) << '"';
            if (g_app_id_enabled.load(std::memory_order_relaxed) && !g_app_id.empty()) {
                std::cerr << ",\"app\":\"";
                json_escape(std::cerr, g_app_id);
                std::cerr << '"';
            }
            std::cerr << ",\"msg\":\"";
            json_escape(std::cerr, m);
            std::cerr << "\"}" << std::endl;
        } else {
            char buf[16];
            std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
            if (g_app_id_enabled.load(std::memory_order_relaxed) && !g_app_id.empty())
                std::cerr << g_app_id << ' ';
            std::cerr << '[' << level_tag(lv) << ' ' << buf << '.' << std::setw(3) << std::setfill('0') << ms
                      << std::setfill(' ') << "] " << m << std::endl;
        }
    }
}

inline std::thread g_thread; // background consumer

inline void consumer_thread()
{
    for (;;) {
        std::deque<item> local;
        {
            std::unique_lock lk(g_q_mtx);
            g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_queue.empty(); });
            if (!g_running.load(std::memory_order_acquire) && g_queue.empty())
                break;
            local.swap(g_queue);
            g_in_flight = local.size();
        }
        for (auto &it : local)
            format_and_write(it.lv, it.msg, it.ts);
        {
            std::lock_guard lk(g_q_mtx);
            g_in_flight = 0;
        }
        g_drained_cv.notify_all();
    }
    g_drained_cv.notify_all();
}

inline void shutdown()
{
    if (!g_started.load(std::memory_order_acquire))
        return;
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_q_cv.notify_all();
    if (g_thread.joinable())
        g_thread.join();
}

inline void start()
{
    if (g_started.load(std::memory_order_acquire))
        return;
    std::lock_guard lk(g_q_mtx);
    if (g_started.load(std::memory_order_relaxed))
        return;
    if (const char *lvl = std::getenv("ARENA_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("ARENA_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("ARENA_LOG_APP_ID")) {
        if (*app) {
            std::lock_guard io(g_io_mtx);
            g_app_id.assign(app);
            g_app_id_enabled.store(true, std::memory_order_relaxed);
        }
    }
    g_running.store(true, std::memory_order_release);
    g_thread = std::thread([] { consumer_thread(); });
    g_started.store(true, std::memory_order_release);
    std::atexit([] { shutdown(); });
}
} // namespace detail

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::g_json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

// Blocks until every message enqueued so far has been written.
inline void flush()
{
    if (!detail::g_running.load(std::memory_order_acquire))
        return;
    std::unique_lock lk(detail::g_q_mtx);
    detail::g_drained_cv.wait(lk, [] {
        return (detail::g_queue.empty() && detail::g_in_flight == 0)
            || !detail::g_running.load(std::memory_order_acquire);
    });
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto tp = std::chrono::system_clock::now();
    if (detail::g_running.load(std::memory_order_acquire)) {
        {
            std::lock_guard lk(detail::g_q_mtx);
            detail::g_queue.push_back(detail::item{lv, std::string(msg), tp});
        }
        detail::g_q_cv.notify_one();
    } else {
        detail::format_and_write(lv, std::string(msg), tp);
    }
}

template <typename... Args>
inline void write(level lv, const char *fmt, Args &&...args)
{
    if (enabled(lv))
        write(lv, std::string_view(detail_format::tiny_format(fmt, std::forward<Args>(args)...)));
}

// Variadic convenience wrappers ({} placeholder based)
template <typename... Args>
inline void trace(const char *fmt, Args &&...args)
{
    write(level::trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    write(level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    write(level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    write(level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    write(level::error, fmt, std::forward<Args>(args)...);
}

} // namespace arena::log
