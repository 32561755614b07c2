#pragma once

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace yfib {

// Renders nanoseconds in the largest unit that keeps the value >= 1
inline std::string format_duration(double ns) {
    static constexpr struct { double scale; const char* fmt; } units[] = {
        {1e9, "%.3f s"}, {1e6, "%.1f ms"}, {1e3, "%.1f us"},
    };
    char buf[64];
    for (const auto& unit : units) {
        if (ns >= unit.scale) {
            std::snprintf(buf, sizeof(buf), unit.fmt, ns / unit.scale);
            return buf;
        }
    }
    std::snprintf(buf, sizeof(buf), "%.1f ns", ns);
    return buf;
}

struct TimerStats {
    uint64_t count = 0;
    double avg = 0.0;
    double min = 0.0;
    double max = 0.0;
};

// Running mean, min and max
inline void add_sample(TimerStats& s, double sample) {
    if (s.count++ == 0) {
        s.avg = s.min = s.max = sample;
        return;
    }
    s.avg += (sample - s.avg) / static_cast<double>(s.count);
    if (sample < s.min) s.min = sample;
    if (sample > s.max) s.max = sample;
}

// Process-wide timing samples keyed by label, fed by ScopeTimer and the
// benchmark harness. Labels print in sorted order.
class TimerManager {
public:
    static TimerManager& instance() {
        static TimerManager mgr;
        return mgr;
    }

    void record(const std::string& label, double duration_ns) {
        std::lock_guard<std::mutex> lock(mutex_);
        add_sample(stats_[label], duration_ns);
    }

    std::optional<TimerStats> stats(const std::string& label) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(label);
        if (it == stats_.end()) return std::nullopt;
        return it->second;
    }

    std::string summary() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& [label, s] : stats_) {
            char line[256];
            std::snprintf(line, sizeof(line), "  %-40s  count=%" PRIu64 "  avg=%s  min=%s  max=%s\n",
                label.c_str(), s.count,
                format_duration(s.avg).c_str(),
                format_duration(s.min).c_str(),
                format_duration(s.max).c_str());
            out += line;
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.clear();
    }

private:
    TimerManager() = default;
    std::mutex mutex_;
    std::map<std::string, TimerStats> stats_;
};

} // namespace yfib
