#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Callbacks for kj::MainBuilder options. Numeric setters reject values that
// are not plain non-negative integers.
std::function<bool()> setBool(bool* var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string* var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t* var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setUint(uint32_t* var);

// Current local time, formatted as ISO-8601 with microseconds.
std::string IsoTimestamp();

}  // namespace util
#endif
