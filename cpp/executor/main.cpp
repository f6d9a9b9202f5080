#include "executor/main.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

#include <kj/async-io.h>
#include <kj/debug.h>

#include "executor/execution_service.hpp"
#include "executor/report.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace executor {

void AddEngineOptions(kj::MainBuilder* builder) {
  builder
      ->addOptionWithArg({'i', "interpreter"},
                         util::setString(&Flags::interpreter), "<PROGRAM>",
                         "Interpreter that runs the programs")
      .addOptionWithArg({'m', "memory-mb"}, util::setUint(&Flags::max_memory_mb),
                        "<MB>", "Address space limit of each program")
      .addOptionWithArg({'c', "cpu-seconds"},
                        util::setUint(&Flags::max_cpu_seconds), "<SECONDS>",
                        "CPU time limit of each program")
      .addOptionWithArg({'n', "max-concurrent"},
                        util::setUint(&Flags::max_concurrent), "<N>",
                        "Maximum number of programs running at once")
      .addOption({"no-isolation"}, util::setBool(&Flags::no_isolation),
                 "Run programs in the current directory instead of a private "
                 "one")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOptionWithArg({"max-files"}, util::setUint(&Flags::max_files), "<N>",
                        "Open file limit of each program")
      .addOptionWithArg({"max-output-kb"}, util::setUint(&Flags::max_output_kb),
                        "<KB>", "Output kept from each stream of a program");
}

kj::MainBuilder::Validity Main::SetSource(kj::StringPtr source) {
  source_ = source.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  std::ostringstream code;
  if (source_ == "-") {
    code << std::cin.rdbuf();
  } else {
    std::ifstream in(source_);
    if (!in) return kj::str("Cannot open ", source_.c_str());
    code << in.rdbuf();
  }
  util::LogManager log_manager(&context);

  ExecutionRequest request;
  request.code = code.str();
  request.timeout_seconds = ClampTimeout(Flags::timeout);
  if (request.code.empty()) return "The program is empty";

  auto io = kj::setupAsyncIo();
  ExecutionService service(ExecutionConfig::FromFlags(), *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(kj::mv(request)).wait(io.waitScope);
  std::cout << Dump(ResponseToJson(response)) << std::endl;
  if (response.status != ExecutionStatus::kSuccess) {
    context.exitError(
        kj::str("Execution status: ", StatusName(response.status)));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Exec-Agent Run (" + util::version + ")",
                          "Runs one program and prints the outcome as JSON");
  builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'t', "timeout"}, util::setUint(&Flags::timeout),
                        "<SECONDS>", "Wall clock limit, between 1 and 30");
  AddEngineOptions(&builder);
  return builder.expectArg("<FILE>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace executor
