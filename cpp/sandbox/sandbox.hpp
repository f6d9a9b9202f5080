#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <string>

#include <kj/common.h>

namespace sandbox {

// The private working directory of one execution. The directory is created
// lazily by Create and removed by Cleanup, or by the destructor if Cleanup was
// never called. A Sandbox is never shared between executions and cannot be
// created again once it has been cleaned up.
class Sandbox {
 public:
  // The directory will be named after execution_id, inside temp_root.
  Sandbox(std::string execution_id, std::string temp_root);
  ~Sandbox();
  KJ_DISALLOW_COPY(Sandbox);

  // Creates the directory and returns its path. Further calls return the same
  // path without touching the filesystem. Throws a kj::Exception if the
  // directory cannot be created, or if the sandbox was already cleaned up.
  const std::string& Create();

  // Removes the directory and everything inside it. Entries that cannot be
  // removed are logged and skipped; nothing is ever thrown. The filesystem is
  // left alone if the directory was never created, but Create is refused
  // from then on either way.
  void Cleanup();

  // Empty until Create succeeds, and again after Cleanup.
  const std::string& Path() const { return path_; }
  const std::string& ExecutionId() const { return execution_id_; }

 private:
  std::string execution_id_;
  std::string temp_root_;
  std::string path_;
  bool cleaned_up_ = false;
};

}  // namespace sandbox

#endif
