#pragma once

// Set YFIB_ENABLED=0 to compile every trace macro away
#ifndef YFIB_ENABLED
#define YFIB_ENABLED 1
#endif

#if YFIB_ENABLED

#include <yfib/timing.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// YFIB_USE_SPDLOG: the default handler forwards to an spdlog logger
// instead of writing to stderr directly
#if defined(YFIB_USE_SPDLOG)
    #include <spdlog/spdlog.h>
    #include <spdlog/sinks/stdout_color_sinks.h>
#endif

namespace yfib {

struct TracePointInfo {
    bool* enabled;
    const char* file;
    int line;
    const char* function;
    const char* level;      // "trace", "debug", "info", "warn", "error", "func-entry", "timer-exit", ...
    const char* message;    // format string
};

// Registry of trace points. Each point is a static bool owned by the macro
// expansion; the manager only flips it.
class TraceManager {
public:
    static TraceManager& instance() {
        static TraceManager mgr;
        return mgr;
    }

    void register_trace_point(bool* enabled, const char* file, int line, const char* function,
                              const char* level, const char* message) {
        std::lock_guard<std::mutex> lock(mutex_);
        points_.push_back(TracePointInfo{enabled, file, line, function, level, message});
        auto it = levels_.find(level);
        if (it != levels_.end()) {
            *enabled = it->second;
        }
    }

    // Also decides the state of points of this level registered later
    void set_level_enabled(const char* level, bool state) {
        std::lock_guard<std::mutex> lock(mutex_);
        levels_[level] = state;
        for (auto& info : points_) {
            if (std::string_view(info.level) == level) {
                *info.enabled = state;
            }
        }
    }

    void set_all_enabled(bool state) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const char* level : kLevels) {
            levels_[level] = state;
        }
        for (auto& info : points_) {
            *info.enabled = state;
        }
    }

    template<typename Func>
    void for_each(Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& info : points_) {
            func(info);
        }
    }

private:
    static constexpr const char* kLevels[] = {
        "trace", "debug", "info", "warn", "error",
        "func-entry", "func-exit", "timer-entry", "timer-exit",
    };

    TraceManager() = default;
    std::mutex mutex_;
    std::vector<TracePointInfo> points_;
    std::map<std::string, bool, std::less<>> levels_;
};

using TraceHandler = std::function<void(const char*, const char*, int, const char*, const char*)>;

namespace detail {
    // YFIB_TRACE_DEFAULT_ON=1|yes|true starts every point enabled
    inline bool default_enabled() {
        static const bool on = [] {
            const char* val = std::getenv("YFIB_TRACE_DEFAULT_ON");
            if (!val) return false;
            std::string_view v(val);
            return v == "1" || v == "yes" || v == "true";
        }();
        return on;
    }

    inline bool register_trace_point(bool* enabled, const char* file, int line, const char* function,
                                     const char* level, const char* message) {
        *enabled = default_enabled();
        TraceManager::instance().register_trace_point(enabled, file, line, function, level, message);
        return *enabled;
    }

#if defined(YFIB_USE_SPDLOG)
    inline spdlog::level::level_enum to_spdlog_level(std::string_view level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        return spdlog::level::debug;
    }

    // Filtering happens at the trace points, so the logger passes everything
    inline std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> log = [] {
            if (auto existing = spdlog::get("yfib")) return existing;
            auto created = spdlog::stderr_color_mt("yfib");
            created->set_level(spdlog::level::trace);
            return created;
        }();
        return log;
    }
#endif
}

inline void default_trace_handler(const char* level, const char* file, int line, const char* function, const char* msg) {
#if defined(YFIB_USE_SPDLOG)
    detail::logger()->log(spdlog::source_loc{file, line, function}, detail::to_spdlog_level(level),
                          "[{}] {}", level, msg);
#else
    std::fprintf(stderr, "[%s] %s:%d (%s): %s\n", level, file, line, function, msg);
#endif
}

inline TraceHandler& trace_handler() {
    static TraceHandler handler = default_trace_handler;
    return handler;
}

inline void set_trace_handler(TraceHandler handler) {
    trace_handler() = std::move(handler);
}

namespace detail {
    template<typename... Args>
    void emit(const char* level, const char* file, int line, const char* function, const char* fmt, Args&&... args) {
        char buffer[1024];
        if constexpr (sizeof...(args) == 0) {
            std::snprintf(buffer, sizeof(buffer), "%s", fmt);
        } else {
            std::snprintf(buffer, sizeof(buffer), fmt, std::forward<Args>(args)...);
        }
        trace_handler()(level, file, line, function, buffer);
    }
}

// Emits func-entry on construction and func-exit on destruction
class ScopeTracer {
public:
    ScopeTracer(bool* exit_enabled, const char* file, int line, const char* function)
        : exit_enabled_(exit_enabled), file_(file), line_(line), function_(function) {
        trace_handler()("func-entry", file_, line_, function_, "");
    }

    ~ScopeTracer() {
        if (*exit_enabled_) {
            trace_handler()("func-exit", file_, line_, function_, "");
        }
    }

private:
    bool* exit_enabled_;
    const char* file_;
    int line_;
    const char* function_;
};

// Records the lifetime of a scope in TimerManager under its label
class ScopeTimer {
public:
    ScopeTimer(const char* label, bool* exit_enabled, const char* file, int line, const char* function)
        : label_(label), exit_enabled_(exit_enabled), file_(file), line_(line), function_(function),
          start_(std::chrono::steady_clock::now()) {
        detail::emit("timer-entry", file_, line_, function_, "%s started", label_);
    }

    ~ScopeTimer() {
        double elapsed_ns = std::chrono::duration<double, std::nano>(
            std::chrono::steady_clock::now() - start_).count();
        if (*exit_enabled_) {
            detail::emit("timer-exit", file_, line_, function_, "%s elapsed: %s",
                         label_, format_duration(elapsed_ns).c_str());
        }
        TimerManager::instance().record(label_, elapsed_ns);
    }

private:
    const char* label_;
    bool* exit_enabled_;
    const char* file_;
    int line_;
    const char* function_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace yfib

#define YFIB_LOG(lvl, fmt, ...) \
    do { \
        static bool _yfib_enabled_ = yfib::detail::register_trace_point(&_yfib_enabled_, __FILE__, __LINE__, __func__, lvl, fmt); \
        if (_yfib_enabled_) { \
            yfib::detail::emit(lvl, __FILE__, __LINE__, __func__, fmt __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while(0)

#define YFIB_FUNC() \
    static bool _yfib_entry_enabled_ = yfib::detail::register_trace_point(&_yfib_entry_enabled_, __FILE__, __LINE__, __func__, "func-entry", ""); \
    static bool _yfib_exit_enabled_ = yfib::detail::register_trace_point(&_yfib_exit_enabled_, __FILE__, __LINE__, __func__, "func-exit", ""); \
    std::optional<yfib::ScopeTracer> _yfib_scope_guard_; \
    if (_yfib_entry_enabled_) _yfib_scope_guard_.emplace(&_yfib_exit_enabled_, __FILE__, __LINE__, __func__)

#define YFIB_TIMEIT(label) \
    static bool _yfib_timer_entry_enabled_ = yfib::detail::register_trace_point(&_yfib_timer_entry_enabled_, __FILE__, __LINE__, __func__, "timer-entry", label); \
    static bool _yfib_timer_exit_enabled_ = yfib::detail::register_trace_point(&_yfib_timer_exit_enabled_, __FILE__, __LINE__, __func__, "timer-exit", label); \
    std::optional<yfib::ScopeTimer> _yfib_timer_guard_; \
    if (_yfib_timer_entry_enabled_) _yfib_timer_guard_.emplace(label, &_yfib_timer_exit_enabled_, __FILE__, __LINE__, __func__)

#define YFIB_ENABLE_ALL()       yfib::TraceManager::instance().set_all_enabled(true)
#define YFIB_DISABLE_ALL()      yfib::TraceManager::instance().set_all_enabled(false)
#define YFIB_ENABLE_LEVEL(lvl)  yfib::TraceManager::instance().set_level_enabled(lvl, true)
#define YFIB_DISABLE_LEVEL(lvl) yfib::TraceManager::instance().set_level_enabled(lvl, false)

#else // !YFIB_ENABLED

#define YFIB_LOG(lvl, fmt, ...) do {} while(0)
#define YFIB_FUNC()             do {} while(0)
#define YFIB_TIMEIT(label)      do {} while(0)
#define YFIB_ENABLE_ALL()       do {} while(0)
#define YFIB_DISABLE_ALL()      do {} while(0)
#define YFIB_ENABLE_LEVEL(lvl)  do {} while(0)
#define YFIB_DISABLE_LEVEL(lvl) do {} while(0)

#endif // YFIB_ENABLED

#define YFIB_TRACE(fmt, ...) YFIB_LOG("trace", fmt __VA_OPT__(,) __VA_ARGS__)
#define YFIB_DEBUG(fmt, ...) YFIB_LOG("debug", fmt __VA_OPT__(,) __VA_ARGS__)
#define YFIB_INFO(fmt, ...)  YFIB_LOG("info", fmt __VA_OPT__(,) __VA_ARGS__)
#define YFIB_WARN(fmt, ...)  YFIB_LOG("warn", fmt __VA_OPT__(,) __VA_ARGS__)
#define YFIB_ERROR(fmt, ...) YFIB_LOG("error", fmt __VA_OPT__(,) __VA_ARGS__)
