#include "executor/main.hpp"
#include "server/main.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

class ExecAgentMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ExecAgentMain(kj::ProcessContext& context)
      : context(context), sm(&context), rm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Exec-Agent (" + util::version + ")",
                           "Runs untrusted programs with resource limits")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain),
                       "serve the HTTP API")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a single program")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  executor::Main rm;
};

KJ_MAIN(ExecAgentMain);
