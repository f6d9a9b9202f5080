#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats every KJ log line of the thread that creates it, and prints a stack
// trace for exceptions when INFO logging is enabled. Must outlive any code
// that logs on that thread.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  std::mutex out_mutex_;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
