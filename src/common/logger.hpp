// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// Callers format on their own thread and enqueue; one background writer owns stderr, so worker and
// dispatcher ticks never block on I/O. The queue is bounded: under a burst the newest lines are dropped and
// the writer reports how many were lost. Configuration:
//  - BULLETSIM_LOG_LEVEL (debug|info|warn|error) or set_level()
//  - BULLETSIM_LOG_JSON (any value) or set_json(): one JSON object per line; a leading "[component]" tag
//    in the message becomes the "component" field
//  - BULLETSIM_LOG_APP_ID or set_app_id(): instance tag on every line
//  - set_callback(): observer invoked on the writer thread after each line

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
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
#include <utility>

namespace bulletsim::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

inline constexpr size_t kMaxQueuedLines = 8192;

namespace detail {

struct line
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

using callback_fn = void (*)(int, const char *, void *);

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> running{false};
    std::once_flag started;
    std::atomic<callback_fn> callback{nullptr};
    std::atomic<void *> callback_ud{nullptr};
    std::atomic<uint64_t> dropped{0};

    std::mutex queue_mtx; // guards pending, writing
    std::condition_variable wake;
    std::condition_variable drained;
    std::deque<line> pending;
    size_t writing{0};

    std::mutex out_mtx; // guards app_id and stderr
    std::string app_id;
    std::thread writer;
};

inline state &instance()
{
    static state s;
    return s;
}

inline int parse_level(std::string_view name)
{
    std::string v(name);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug" || v == "trace")
        return static_cast<int>(level::debug);
    if (v == "warn" || v == "warning")
        return static_cast<int>(level::warn);
    if (v == "error" || v == "err")
        return static_cast<int>(level::error);
    return static_cast<int>(level::info);
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
        default:
            return "info";
    }
}

// Splits "[component] rest" into its parts; returns an empty component when there is no tag.
inline std::pair<std::string_view, std::string_view> split_component(std::string_view msg)
{
    if (msg.size() < 3 || msg.front() != '[')
        return {{}, msg};
    auto close = msg.find(']');
    if (close == std::string_view::npos || close == 1)
        return {{}, msg};
    auto rest = msg.substr(close + 1);
    if (!rest.empty() && rest.front() == ' ')
        rest.remove_prefix(1);
    return {msg.substr(1, close - 1), rest};
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

inline void emit(const line &ln)
{
    auto &s = instance();
    std::time_t tt = std::chrono::system_clock::to_time_t(ln.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ln.ts.time_since_epoch()).count() % 1000;
    std::ostringstream os;
    if (s.json.load(std::memory_order_relaxed)) {
        auto [component, body] = split_component(ln.text);
        os << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
           << ms << "\",\"level\":\"" << level_name(ln.lv) << '"';
        {
            std::lock_guard lk(s.out_mtx);
            if (!s.app_id.empty()) {
                os << ",\"app\":\"";
                json_escape(os, s.app_id);
                os << '"';
            }
        }
        if (!component.empty()) {
            os << ",\"component\":\"";
            json_escape(os, component);
            os << '"';
        }
        os << ",\"msg\":\"";
        json_escape(os, body);
        os << "\"}";
    } else {
        static constexpr std::array<char, 4> tags{'D', 'I', 'W', 'E'};
        {
            std::lock_guard lk(s.out_mtx);
            if (!s.app_id.empty())
                os << s.app_id << ' ';
        }
        os << '[' << tags[static_cast<size_t>(ln.lv)] << ' ' << std::put_time(&tm, "%H:%M:%S") << '.'
           << std::setw(3) << std::setfill('0') << ms << "] " << ln.text;
    }
    {
        std::lock_guard lk(s.out_mtx);
        std::cerr << os.str() << '\n';
        std::cerr.flush();
    }
    if (auto cb = s.callback.load(std::memory_order_acquire))
        cb(static_cast<int>(ln.lv), ln.text.c_str(), s.callback_ud.load(std::memory_order_acquire));
}

inline void writer_loop()
{
    auto &s = instance();
    std::unique_lock lk(s.queue_mtx);
    while (true) {
        s.wake.wait(lk, [&] { return !s.running.load(std::memory_order_acquire) || !s.pending.empty(); });
        if (s.pending.empty() && !s.running.load(std::memory_order_acquire))
            break;
        std::deque<line> batch;
        batch.swap(s.pending);
        s.writing = batch.size();
        lk.unlock();
        if (auto lost = s.dropped.exchange(0, std::memory_order_relaxed))
            emit(line{level::warn, "[log] dropped " + std::to_string(lost) + " lines (queue full)",
                      std::chrono::system_clock::now()});
        for (auto &ln : batch)
            emit(ln);
        lk.lock();
        s.writing = 0;
        s.drained.notify_all();
    }
    s.drained.notify_all();
}

inline void stop()
{
    auto &s = instance();
    {
        std::lock_guard lk(s.queue_mtx);
        if (!s.running.exchange(false, std::memory_order_acq_rel))
            return;
    }
    s.wake.notify_all();
    if (s.writer.joinable())
        s.writer.join();
}

inline void start()
{
    auto &s = instance();
    std::call_once(s.started, [&] {
        if (const char *lvl = std::getenv("BULLETSIM_LOG_LEVEL"))
            s.min_level.store(parse_level(lvl), std::memory_order_relaxed);
        if (std::getenv("BULLETSIM_LOG_JSON"))
            s.json.store(true, std::memory_order_relaxed);
        if (const char *app = std::getenv("BULLETSIM_LOG_APP_ID"); app && *app) {
            std::lock_guard lk(s.out_mtx);
            s.app_id = app;
        }
        s.running.store(true, std::memory_order_release);
        s.writer = std::thread(writer_loop);
        std::atexit(stop);
    });
}

} // namespace detail

namespace detail_format {

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Substitutes "{}" placeholders in order; arguments without a placeholder are appended space-separated.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    std::array<std::string, sizeof...(Args)> values{to_text(args)...};
    std::string out;
    out.reserve(fmt.size() + sizeof...(Args) * 8);
    size_t pos = 0;
    size_t next = 0;
    for (; next < values.size(); ++next) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt, pos, p - pos);
        out += values[next];
        pos = p + 2;
    }
    out.append(fmt.substr(pos));
    for (; next < values.size(); ++next) {
        out.push_back(' ');
        out += values[next];
    }
    return out;
}

} // namespace detail_format

inline void init()
{
    detail::start();
}

// Overrides BULLETSIM_LOG_LEVEL when called after init().
inline void set_level(std::string_view name)
{
    detail::instance().min_level.store(detail::parse_level(name), std::memory_order_relaxed);
}

inline void set_json(bool on) noexcept
{
    detail::instance().json.store(on, std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    auto &s = detail::instance();
    std::lock_guard lk(s.out_mtx);
    s.app_id = std::move(id);
}

inline bool enabled(level lv)
{
    detail::start(); // environment settings apply from the first call
    return static_cast<int>(lv) >= detail::instance().min_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    auto &s = detail::instance();
    s.callback_ud.store(ud, std::memory_order_release);
    s.callback.store(cb, std::memory_order_release);
}

inline uint64_t dropped_lines() noexcept
{
    return detail::instance().dropped.load(std::memory_order_relaxed);
}

// Blocks until every line queued so far has been written.
inline void flush()
{
    auto &s = detail::instance();
    std::unique_lock lk(s.queue_mtx);
    s.drained.wait(lk, [&] {
        return (s.pending.empty() && s.writing == 0) || !s.running.load(std::memory_order_acquire);
    });
}

inline void write(level lv, std::string text)
{
    if (!enabled(lv))
        return;
    auto &s = detail::instance();
    detail::line ln{lv, std::move(text), std::chrono::system_clock::now()};
    {
        std::lock_guard lk(s.queue_mtx);
        if (s.running.load(std::memory_order_acquire)) {
            if (s.pending.size() >= kMaxQueuedLines) {
                s.dropped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            s.pending.push_back(std::move(ln));
            s.wake.notify_one();
            return;
        }
    }
    detail::emit(ln); // after shutdown: write synchronously
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::format(fmt, args...));
}

} // namespace bulletsim::log
