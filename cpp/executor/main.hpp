#ifndef EXECUTOR_MAIN_HPP
#define EXECUTOR_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace executor {

// Adds the options that configure the engine, shared by every sub-command
// that runs programs.
void AddEngineOptions(kj::MainBuilder* builder);

// Runs a single program read from a file, or from stdin, and prints the
// response as JSON.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity SetSource(kj::StringPtr source);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string source_;
};
}  // namespace executor
#endif
