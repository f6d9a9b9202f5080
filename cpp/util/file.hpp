#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>

namespace util {

class File {
 public:
  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Creates a new, uniquely named directory inside base whose name starts
  // with prefix, and returns its path. Throws std::system_error on failure.
  static std::string MakeTempDir(const std::string& base,
                                 const std::string& prefix);

  // Recursively removes a tree, skipping the entries that cannot be removed
  // instead of stopping at the first one. Every failure is logged as a
  // warning. Returns the number of entries that could not be removed.
  static size_t RemoveTreeBestEffort(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path names a directory.
  static bool IsDirectory(const std::string& path);

  // Bytes available to unprivileged users on the filesystem holding path.
  // Returns a negative number in case of errors.
  static int64_t FreeSpace(const std::string& path);
};

}  // namespace util

#endif
