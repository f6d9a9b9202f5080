#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // Engine flags
  static std::string interpreter;
  static uint32_t max_memory_mb;
  static uint32_t max_cpu_seconds;
  static uint32_t max_concurrent;
  static bool no_isolation;
  static std::string temp_directory;
  static uint32_t max_files;
  static uint32_t max_output_kb;

  // Server-only flags
  static bool daemon;
  static std::string pidfile;
  static std::string listen_address;
  static int32_t port;

  // Run-only flags
  static uint32_t timeout;
};

#endif
