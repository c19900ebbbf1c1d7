// include/log.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <utility>
#include <sstream>
#include <optional>

namespace studio::log {

// ---------- Log levels ----------
enum class LogLevel : uint8_t { kOff, kFatal, kError, kWarn, kInfo, kDebug, kVerbose };

inline constexpr std::string_view ToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kFatal:   return "FATAL";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kWarn:    return "WARN";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kVerbose: return "VERBOSE";
    default:                 return "OFF";
  }
}

// Accepts the lowercase names used in the application manifest ("warn", "debug", ...)
std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

// ---------- Record & sink ----------
struct LogRecord {
  std::string app_id;  // e.g., "studio"
  std::string ctx_id;  // e.g., "STOR"
  LogLevel    level;
  std::string message;
  uint64_t    ts_ns;   // wall clock, ns since epoch
  const char* file = nullptr;
  uint32_t    line = 0;
};

struct ISink {
  virtual ~ISink() = default;
  virtual void write(const LogRecord& rec) noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;

// ---------- Manager (process-wide config & sinks) ----------
class LogManager {
public:
  static LogManager& Instance() {
    static LogManager g;
    return g;
  }

  void SetAppId(std::string app) {
    std::scoped_lock lk(mu_);
    app_id_ = std::move(app);
  }

  void SetDefaultLevel(LogLevel lvl) {
    std::scoped_lock lk(mu_);
    default_level_ = lvl;
  }

  void AddSink(SinkPtr s) {
    std::scoped_lock lk(mu_);
    sinks_.push_back(std::move(s));
  }

  void ClearSinks() {
    std::scoped_lock lk(mu_);
    sinks_.clear();
  }

  // Loggers copy this once at creation; later AddSink calls only reach new loggers
  void Snapshot(std::vector<SinkPtr>& out, std::string& app, LogLevel& def) const {
    std::scoped_lock lk(mu_);
    out = sinks_; app = app_id_; def = default_level_;
  }

private:
  LogManager() = default;
  mutable std::mutex mu_;
  std::vector<SinkPtr> sinks_;
  std::string app_id_{"studio"};
  LogLevel default_level_{LogLevel::kInfo};
};

// ---------- Logger (per-context) ----------
class Logger {
public:
  static Logger CreateLogger(std::string ctxId, std::optional<LogLevel> level = std::nullopt) {
    std::vector<SinkPtr> sinks; std::string app; LogLevel def{};
    LogManager::Instance().Snapshot(sinks, app, def);
    return Logger(std::move(ctxId), std::move(app), std::move(sinks), level.value_or(def));
  }

  LogLevel Level() const noexcept { return level_; }
  void SetLevel(LogLevel lvl) noexcept { level_ = lvl; }
  const std::string& ContextId() const noexcept { return ctx_id_; }

  void Log(LogLevel lvl, std::string_view msg, const char* file = nullptr, uint32_t line = 0) const {
    if (!ShouldLog(lvl)) return;
    LogRecord r;
    r.app_id  = app_id_;
    r.ctx_id  = ctx_id_;
    r.level   = lvl;
    r.message = std::string(msg);
    r.file    = file;
    r.line    = line;
    r.ts_ns   = NowNs();
    for (const auto& s : sinks_) if (s) s->write(r);
  }

  template <typename... Args>
  void LogF(LogLevel lvl, const char* file, uint32_t line, std::string_view fmt, Args&&... args) const {
    if (!ShouldLog(lvl)) return;
    std::ostringstream oss;
    FormatInto(oss, fmt, std::forward<Args>(args)...);
    Log(lvl, oss.str(), file, line);
  }

private:
  Logger(std::string ctx, std::string app, std::vector<SinkPtr> sinks, LogLevel lvl)
      : ctx_id_(std::move(ctx)), app_id_(std::move(app)),
        sinks_(std::move(sinks)), level_(lvl) {}

  static uint64_t NowNs() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
  }

  bool ShouldLog(LogLevel lvl) const noexcept {
    if (level_ == LogLevel::kOff || lvl == LogLevel::kOff) return false;
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level_);
  }

  // "{}" placeholders are filled left to right via operator<<
  static void ReplaceFirstBrace(std::ostringstream& oss, std::string_view& fmt) {
    auto pos = fmt.find("{}");
    if (pos == std::string_view::npos) { oss << fmt; fmt = {}; return; }
    oss << fmt.substr(0, pos);
    fmt.remove_prefix(pos + 2);
  }
  template <typename T, typename... Rest>
  static void FormatInto(std::ostringstream& oss, std::string_view fmt, T&& value, Rest&&... rest) {
    ReplaceFirstBrace(oss, fmt);
    oss << std::forward<T>(value);
    if constexpr (sizeof...(rest) == 0) { oss << fmt; }
    else { FormatInto(oss, fmt, std::forward<Rest>(rest)...); }
  }
  static void FormatInto(std::ostringstream& oss, std::string_view fmt) { oss << fmt; }

  std::string ctx_id_;
  std::string app_id_;
  std::vector<SinkPtr> sinks_;
  LogLevel level_;
};

// ---------- Macros capturing file/line ----------
#define STUDIO_LOGFATAL(lg, fmt, ...)   (lg).LogF(::studio::log::LogLevel::kFatal,   __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define STUDIO_LOGERROR(lg, fmt, ...)   (lg).LogF(::studio::log::LogLevel::kError,   __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define STUDIO_LOGWARN(lg,  fmt, ...)   (lg).LogF(::studio::log::LogLevel::kWarn,    __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define STUDIO_LOGINFO(lg,  fmt, ...)   (lg).LogF(::studio::log::LogLevel::kInfo,    __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define STUDIO_LOGDEBUG(lg, fmt, ...)   (lg).LogF(::studio::log::LogLevel::kDebug,   __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define STUDIO_LOGVERBOSE(lg, fmt, ...) (lg).LogF(::studio::log::LogLevel::kVerbose, __FILE__, __LINE__, (fmt), ##__VA_ARGS__)

} // namespace studio::log
