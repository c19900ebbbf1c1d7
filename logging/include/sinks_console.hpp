#pragma once
#include "log.hpp"
#include <iostream>

namespace studio::log {

// stdout belongs to command output, so diagnostics go to stderr
struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    std::cerr << "[" << ToString(r.level) << "] "
              << r.app_id << "/" << r.ctx_id << ": " << r.message << std::endl;
  }
};

} // namespace studio::log
