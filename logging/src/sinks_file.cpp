#include "sinks_file.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace studio::log {

namespace {

std::string FormatTimestamp(uint64_t ts_ns) {
  const std::time_t secs = static_cast<std::time_t>(ts_ns / 1000000000ULL);
  const unsigned ms = static_cast<unsigned>((ts_ns / 1000000ULL) % 1000ULL);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &secs);
#else
  localtime_r(&secs, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
     << '.' << std::setfill('0') << std::setw(3) << ms;
  return ss.str();
}

} // namespace

FileSink::FileSink(const std::string& path) {
  std::error_code ec;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  out_.open(path, std::ios::app);
  if (!out_.is_open()) {
    std::cerr << "[WARN] cannot open log file: " << path << std::endl;
  }
}

void FileSink::write(const LogRecord& r) noexcept {
  std::scoped_lock lk(mu_);
  if (!out_.is_open()) return;
  out_ << FormatTimestamp(r.ts_ns) << " [" << ToString(r.level) << "] "
       << r.app_id << "/" << r.ctx_id << ": " << r.message;
  if (r.file) out_ << " (" << r.file << ":" << r.line << ")";
  out_ << '\n';
  out_.flush();
}

} // namespace studio::log
