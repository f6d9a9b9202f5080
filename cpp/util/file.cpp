#include "util/file.hpp"

#include <kj/debug.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

thread_local size_t remove_failures = 0;

size_t OsRemoveTreeBestEffort(const std::string& path) {
  remove_failures = 0;
  int ret = nftw(path.c_str(),
                 [](const char* fpath, const struct stat* /*sb*/,
                    int typeflags, struct FTW* /*ftwbuf*/) {
                   if (typeflags == FTW_DNR || typeflags == FTW_NS) {
                     KJ_LOG(WARNING, "Cannot inspect", fpath);
                     remove_failures++;
                     return 0;
                   }
                   if (remove(fpath) == -1) {
                     KJ_LOG(WARNING, "Cannot remove", fpath, strerror(errno));
                     remove_failures++;
                   }
                   return 0;
                 },
                 64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT);
  if (ret == -1 && errno != ENOENT) {
    KJ_LOG(WARNING, "Cannot walk", path, strerror(errno));
    remove_failures++;
  }
  return remove_failures;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& base, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(base, prefix + "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

}  // namespace

namespace util {

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

std::string File::MakeTempDir(const std::string& base,
                              const std::string& prefix) {
  std::string path = OsTempDir(base, prefix);
  if (path.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp " + base);
  }
  return path;
}

size_t File::RemoveTreeBestEffort(const std::string& path) {
  return OsRemoveTreeBestEffort(path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

int64_t File::FreeSpace(const std::string& path) {
  struct statvfs st {};
  if (statvfs(path.c_str(), &st) != 0) return -1;
  return static_cast<int64_t>(st.f_bavail) * st.f_frsize;
}

}  // namespace util
