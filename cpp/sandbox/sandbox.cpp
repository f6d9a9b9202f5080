#include "sandbox/sandbox.hpp"

#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"

namespace sandbox {

Sandbox::Sandbox(std::string execution_id, std::string temp_root)
    : execution_id_(std::move(execution_id)),
      temp_root_(std::move(temp_root)) {}

Sandbox::~Sandbox() { Cleanup(); }

const std::string& Sandbox::Create() {
  KJ_REQUIRE(!cleaned_up_, "Sandbox already cleaned up", execution_id_);
  if (!path_.empty()) return path_;
  try {
    path_ = util::File::MakeTempDir(temp_root_, execution_id_ + "_");
  } catch (const std::system_error& exc) {
    KJ_FAIL_SYSCALL("mkdtemp", exc.code().value(), temp_root_, execution_id_);
  }
  KJ_LOG(INFO, "Created sandbox", path_);
  return path_;
}

void Sandbox::Cleanup() {
  cleaned_up_ = true;
  if (path_.empty()) return;
  size_t failures = util::File::RemoveTreeBestEffort(path_);
  if (failures != 0) {
    KJ_LOG(WARNING, "Sandbox not fully removed", path_, failures);
  } else {
    KJ_LOG(INFO, "Removed sandbox", path_);
  }
  path_.clear();
}

}  // namespace sandbox
