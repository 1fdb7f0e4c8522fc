#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/console.h — Leveled console logging for the compiler
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::debug("Lowered", count, "operations");
//
//  Output goes to stdout (log/info/success/debug) or stderr
//  (warn/error) unless a sink has been installed with setSink().
//
// ═══════════════════════════════════════════════════════════════════

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace gqlir::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

struct State {
    std::atomic<Level> level{Level::Info};
    std::ostream* sink = nullptr;   // nullptr: stdout / stderr
    bool colors = true;
    // Serializes writes and the timer table
    std::mutex mutex;
};

inline State& state() {
    static State s;
    return s;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
        return arg.dump();
    } else if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (requires(std::ostream& os) { os << arg; }) {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    } else {
        return nlohmann::json(arg).dump();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& fallback, const char* color,
           const char* prefix, const Args&... args) {
    auto& s = state();
    if (level < s.level) return;

    std::lock_guard<std::mutex> lock(s.mutex);
    std::ostream& os = s.sink ? *s.sink : fallback;
    if (s.colors) {
        os << Colors::Gray << "[" << timestamp() << "] "
           << color << prefix << Colors::Reset;
    } else {
        os << "[" << timestamp() << "] " << prefix;
    }

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) os << " ";
        first = false;
        os << stringify(arg);
    };
    (printOne(args), ...);
    os << std::endl;
}

inline std::unordered_map<std::string, std::chrono::steady_clock::time_point>& timers() {
    static std::unordered_map<std::string, std::chrono::steady_clock::time_point> t;
    return t;
}

} // namespace detail

// ── Configuration ──
inline void setLevel(Level level) { detail::state().level = level; }
inline Level level() { return detail::state().level; }

// Redirect all output to `os` (pass nullptr to restore stdout/stderr).
// Colors are disabled while a sink is installed.
inline void setSink(std::ostream* os) {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    detail::state().sink = os;
    detail::state().colors = (os == nullptr);
}

inline bool enabled(Level level) { return level >= detail::state().level; }

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

// ── console::time / console::timeEnd ──
//  Labels are process-wide; concurrent callers need distinct labels.
inline void time(const std::string& label) {
    std::lock_guard<std::mutex> lock(detail::state().mutex);
    detail::timers()[label] = std::chrono::steady_clock::now();
}

// Logs the elapsed time at `level` and returns it in milliseconds.
inline double timeEnd(const std::string& label, Level level = Level::Info) {
    std::optional<std::chrono::steady_clock::time_point> start;
    {
        std::lock_guard<std::mutex> lock(detail::state().mutex);
        auto it = detail::timers().find(label);
        if (it != detail::timers().end()) {
            start = it->second;
            detail::timers().erase(it);
        }
    }
    if (!start) {
        warn("Timer '" + label + "' does not exist");
        return 0.0;
    }
    auto elapsed = std::chrono::steady_clock::now() - *start;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    detail::print(level, std::cout, detail::Colors::Reset, "",
                  label + ":", std::to_string(ms) + "ms");
    return ms;
}

} // namespace gqlir::console
