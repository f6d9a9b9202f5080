#include "util/misc.hpp"

#include <sys/time.h>
#include <cstdio>
#include <ctime>
#include <limits>

namespace util {

namespace {
bool ParseUnsigned(kj::StringPtr p, uint64_t max, uint64_t* out) {
  if (p.size() == 0) return false;
  uint64_t value = 0;
  for (char c : p) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
    if (value > max) return false;
  }
  *out = value;
  return true;
}
}  // namespace

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool* var) {
  return [var]() {
    *var = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string* var) {
  return [var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    *var = p.cStr();
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t* var) {
  return [var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    uint64_t value = 0;
    if (!ParseUnsigned(p, std::numeric_limits<int32_t>::max(), &value)) {
      return "expected a non-negative integer";
    }
    *var = static_cast<int32_t>(value);
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setUint(
    uint32_t* var) {
  return [var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    uint64_t value = 0;
    if (!ParseUnsigned(p, std::numeric_limits<uint32_t>::max(), &value)) {
      return "expected a non-negative integer";
    }
    *var = static_cast<uint32_t>(value);
    return true;
  };
}

std::string IsoTimestamp() {
  struct timeval tv {};
  gettimeofday(&tv, nullptr);
  struct tm tm {};
  localtime_r(&tv.tv_sec, &tm);
  char date[32] = {};
  strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char buf[64] = {};
  snprintf(buf, sizeof(buf), "%s.%06ld", date,  // NOLINT
           static_cast<long>(tv.tv_usec));     // NOLINT
  return buf;
}

}  // namespace util
