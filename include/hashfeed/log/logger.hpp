#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <exception>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace hashfeed {
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
    Fatal
};

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Unknown names resolve to Info.
[[nodiscard]]
inline constexpr Level level_from_string(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Process-wide logger
// ---------------------------------------------------------
// Callable from any thread, including the broker I/O threads:
// formatting happens in the caller, only the sink write is serialized.
// Never throws out of log(): a record the sink cannot take is counted in
// dropped_records() instead, so logging is safe in noexcept code.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    void set_level(std::string_view name) noexcept { set_level(level_from_string(name)); }

    [[nodiscard]]
    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Redirect output (stdout by default). The stream must outlive the logger use.
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) noexcept {
        if (!enabled(lvl)) return;
        try {
            const bool color = color_enabled_.load(std::memory_order_relaxed);
            const std::string ts = timestamp();
            std::lock_guard<std::mutex> lock(mutex_);
            auto& os = *out_;
            if (color) os << color_code(lvl);
            os << ts << " [" << level_name(lvl) << "] " << msg;
            if (color) os << "\033[0m";
            os << '\n';
            if (lvl >= Level::Warn) {
                os.flush();
            }
        }
        catch (const std::exception&) {
            record_dropped();
        }
    }

    // Records lost to allocation or sink failures
    [[nodiscard]]
    std::uint64_t dropped_records() const noexcept { return dropped_.load(std::memory_order_relaxed); }

    void record_dropped() noexcept { dropped_.fetch_add(1, std::memory_order_relaxed); }

private:
    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(true)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
        }
        return "\033[0m";
    }

    // Local wall-clock time with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::string out(buf, n);
        out += '.';
        if (ms < 100) out += '0';
        if (ms < 10)  out += '0';
        out += std::to_string(ms);
        return out;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::atomic<std::uint64_t> dropped_{0};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log record (collects << into a string, emits on destruction;
// Logger::log() is noexcept so the destructor never throws)
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

inline void set_level(std::string_view name) noexcept {
    Logger::instance().set_level(name);
}

} // namespace log
} // namespace hashfeed


// ---------------------------------------------------------
// Logging macros
// ---------------------------------------------------------
// The level check happens before the stream is built so disabled
// records cost one atomic load. A record whose formatting throws is
// counted as dropped; the macros are usable in noexcept functions.
#define HF_LOG_LEVEL(lvl, msg)                                              \
    do {                                                                    \
        if (::hashfeed::log::Logger::instance().enabled((lvl))) {           \
            try {                                                           \
                ::hashfeed::log::LogStream((lvl)) << msg;                   \
            }                                                               \
            catch (const ::std::exception&) {                               \
                ::hashfeed::log::Logger::instance().record_dropped();       \
            }                                                               \
        }                                                                   \
    } while (0)

#define HF_TRACE(msg)  HF_LOG_LEVEL(::hashfeed::log::Level::Trace, msg)
#define HF_DEBUG(msg)  HF_LOG_LEVEL(::hashfeed::log::Level::Debug, msg)
#define HF_INFO(msg)   HF_LOG_LEVEL(::hashfeed::log::Level::Info,  msg)
#define HF_WARN(msg)   HF_LOG_LEVEL(::hashfeed::log::Level::Warn,  msg)
#define HF_ERROR(msg)  HF_LOG_LEVEL(::hashfeed::log::Level::Error, msg)
#define HF_FATAL(msg)  HF_LOG_LEVEL(::hashfeed::log::Level::Fatal, msg)
