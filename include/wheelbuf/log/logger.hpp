#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace wheelbuf {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// Maps "trace" | "debug" | "info" | "warn" | "error" | "fatal" | "off".
// Anything else falls back to Info.
inline constexpr Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level_;
    }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // stdout by default; nullptr restores stdout
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        os.flush();
    }

    static constexpr const char* level_name(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   return "OFF";
        }
        return "?????";
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static constexpr const char* color_code(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        const auto t = system_clock::to_time_t(system_clock::now());
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return std::string(buf, n);
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log record, flushed to the logger on destruction
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace wheelbuf


// ---------------------------------------------------------
// Logging macros. The message expression is only evaluated
// when the level is enabled.
// ---------------------------------------------------------
#define WB_LOG_LEVEL(lvl, msg)                                              \
    do {                                                                    \
        if (::wheelbuf::log::Logger::instance().enabled((lvl))) {           \
            ::wheelbuf::log::LogStream((lvl)) << msg;                       \
        }                                                                   \
    } while (0)

#define WB_TRACE(msg)  WB_LOG_LEVEL(::wheelbuf::log::Level::Trace, msg)
#define WB_DEBUG(msg)  WB_LOG_LEVEL(::wheelbuf::log::Level::Debug, msg)
#define WB_INFO(msg)   WB_LOG_LEVEL(::wheelbuf::log::Level::Info,  msg)
#define WB_WARN(msg)   WB_LOG_LEVEL(::wheelbuf::log::Level::Warn,  msg)
#define WB_ERROR(msg)  WB_LOG_LEVEL(::wheelbuf::log::Level::Error, msg)
#define WB_FATAL(msg)  WB_LOG_LEVEL(::wheelbuf::log::Level::Fatal, msg)
