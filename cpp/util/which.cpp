#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;

bool IsExecutable(const std::string& path) {
  return !util::File::IsDirectory(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return IsExecutable(cmd) ? cmd : "";
  }

  if (use_cache) {
    std::lock_guard<std::mutex> lck(cmd_cache_mutex);
    auto it = cmd_cache.find(cmd);
    if (it != cmd_cache.end()) {
      if (IsExecutable(it->second)) return it->second;
      cmd_cache.erase(it);
    }
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) {
      std::lock_guard<std::mutex> lck(cmd_cache_mutex);
      return cmd_cache[cmd] = fullpath;
    }
  }
  return "";
}

}  // namespace util
