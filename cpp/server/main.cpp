#include "server/main.hpp"
#include <csignal>
#include <cstring>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>

#include "executor/execution_service.hpp"
#include "executor/main.hpp"
#include "server/health.hpp"
#include "server/server.hpp"
#include "util/daemon.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  if (Flags::port < 0 || Flags::port > 65535) return "Invalid port";
  if (Flags::daemon) {
    util::daemonize("server", Flags::pidfile);
  }
  util::LogManager log_manager(&context);

  // Before any thread exists, so that every thread blocks them.
  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);
  auto io = kj::setupAsyncIo();

  executor::ExecutionConfig config = executor::ExecutionConfig::FromFlags();
  executor::ExecutionService service(config, *io.lowLevelProvider);
  HealthChecker health(config, &sandbox::ProcessRunner::Create);
  kj::HttpHeaderTable table;
  Server http_service(&service, &health, *io.lowLevelProvider, table);
  kj::HttpServer http(io.provider->getTimer(), table, http_service);

  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address, Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "Listening", address->toString(), config.interpreter,
         config.max_concurrent_executions, config.temp_root);

  auto stop = io.unixEventPort.onSignal(SIGINT)
                  .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
                  .then([](siginfo_t info) {
                    KJ_LOG(WARNING, "Shutting down", strsignal(info.si_signo));
                  });
  http.listenHttp(*listener).exclusiveJoin(kj::mv(stop)).wait(io.waitScope);
  http.drain().wait(io.waitScope);
  service.Drain().wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Exec-Agent Server (" + util::version + ")",
                          "Runs untrusted programs received over HTTP");
  builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages")
      .addOption({'d', "daemon"}, util::setBool(&Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(&Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on");
  executor::AddEngineOptions(&builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, Run)).build();
}
}  // namespace server
