#pragma once
#include "log.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace studio::log {

// Appends one line per record to a log file. Creates parent directories on open.
class FileSink : public ISink {
public:
  explicit FileSink(const std::string& path);

  bool IsOpen() const noexcept { return out_.is_open(); }
  void write(const LogRecord& r) noexcept override;

private:
  std::mutex mu_;
  std::ofstream out_;
};

} // namespace studio::log
