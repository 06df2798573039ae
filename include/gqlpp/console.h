#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/console.h — Levelled console logging
// ═══════════════════════════════════════════════════════════════════
//
//  console::debug("registered", "OBJECT", name);
//  console::setLevel(console::Level::Debug);
//
//  Messages below the current level are dropped. Output goes to the
//  configured streams (std::cout / std::cerr unless redirected).
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace gqlpp::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

NLOHMANN_JSON_SERIALIZE_ENUM(Level, {
    {Level::Debug, "debug"},
    {Level::Info, "info"},
    {Level::Warn, "warn"},
    {Level::Error, "error"},
    {Level::Silent, "silent"},
})

namespace detail {

struct Colors {
    static constexpr const char* Reset  = "\033[0m";
    static constexpr const char* Red    = "\033[31m";
    static constexpr const char* Yellow = "\033[33m";
    static constexpr const char* Blue   = "\033[34m";
    static constexpr const char* Cyan   = "\033[36m";
    static constexpr const char* Gray   = "\033[90m";
};

struct State {
    std::atomic<Level> level{Level::Warn};
    std::atomic<bool> colors{true};
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
    std::mutex mutex;
};

inline State& state() {
    static State s;
    return s;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, const char* color, const char* prefix, const Args&... args) {
    auto& s = state();
    if (level < s.level.load()) return;

    std::ostringstream line;
    bool colors = s.colors.load();
    if (colors) line << Colors::Gray;
    line << "[" << timestamp() << "] ";
    if (colors) line << color;
    line << prefix;
    if (colors) line << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);

    std::lock_guard<std::mutex> lock(s.mutex);
    std::ostream& os = level >= Level::Warn ? *s.err : *s.out;
    os << line.str() << std::endl;
}

} // namespace detail

// ── Configuration ──
inline void setLevel(Level level) { detail::state().level.store(level); }
inline Level level() { return detail::state().level.load(); }
inline bool enabled(Level level) { return level >= detail::state().level.load(); }
inline void setColors(bool on) { detail::state().colors.store(on); }

// Redirect output; both streams must outlive further logging.
inline void setStreams(std::ostream& out, std::ostream& err) {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.out = &out;
    s.err = &err;
}

inline void resetStreams() { setStreams(std::cout, std::cerr); }

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, detail::Colors::Cyan, "● ", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, detail::Colors::Red, "✖ ", args...);
}

} // namespace gqlpp::console
