#include "exec/executive.hpp"

#include "../common/assertions.hpp"
#include "core/errors/exit_codes.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {

using batchexec::exec::Executive;
using batchexec::exec::ExecutiveOptions;
using batchexec::tests::common::AssertContains;
using batchexec::tests::common::AssertNotContains;
using batchexec::tests::common::Fail;

struct TerminateRecord {
  std::vector<int> exit_codes;
  std::vector<std::string> messages;
};

ExecutiveOptions OptionsFor(const std::string& fatal, std::ostream& sink,
                            batchexec::lov::EnumRegistry& registry, TerminateRecord& record) {
  ExecutiveOptions options;
  options.overrides["fatal"] = fatal;
  options.log_sink = &sink;
  options.min_log_level = batchexec::core::logging::LogLevel::kInfo;
  options.enum_registry = &registry;
  options.program_path = "/opt/jobs/nightly.sh";
  options.terminate_handler = [&record](int exit_code, const std::string& message) {
    record.exit_codes.push_back(exit_code);
    record.messages.push_back(message);
  };
  return options;
}

// One failing operation from each registry plus a direct escalation.
std::vector<int> RunFailingSequence(Executive& exec) {
  std::vector<int> returned;
  returned.push_back(exec.Set("no_such_attribute", std::string("x")));
  returned.push_back(exec.Set("echo", std::string("maybe")));
  returned.push_back(static_cast<int>(exec.LovKeys("no_such_lov").size()));
  returned.push_back(exec.Cough("explicit failure"));
  return returned;
}

} // namespace

int main() {
  // fatal=0: every failure warns and returns; the terminate handler never runs.
  {
    std::ostringstream sink;
    batchexec::lov::EnumRegistry registry;
    TerminateRecord record;
    Executive exec(OptionsFor("0", sink, registry, record));

    if (exec.Fatal()) {
      Fail("fatal=0 override should clear the fatal flag");
    }
    const std::vector<int> returned = RunFailingSequence(exec);
    if (returned != std::vector<int>{-1, -1, 0, -1}) {
      Fail("non-fatal failures should return the cough sentinel");
    }
    if (!record.exit_codes.empty()) {
      Fail("terminate handler must not run with fatal=0");
    }

    const std::string logged = sink.str();
    AssertContains(logged, "level=WARN");
    AssertContains(logged, "WARNING UNKNOWN_ATTRIBUTE");
    AssertContains(logged, "WARNING INVALID_KIND");
    AssertContains(logged, "WARNING UNKNOWN_CLASS");
    AssertContains(logged, "WARNING explicit failure");
    AssertNotContains(logged, "FATAL");
  }

  // fatal=1 with a recording handler: same sequence, every failure escalates.
  {
    std::ostringstream sink;
    batchexec::lov::EnumRegistry registry;
    TerminateRecord record;
    Executive exec(OptionsFor("1", sink, registry, record));

    if (!exec.Fatal()) {
      Fail("fatal=1 override should set the fatal flag");
    }
    RunFailingSequence(exec);

    if (record.exit_codes.size() != 4U) {
      Fail("expected four escalations, got " + std::to_string(record.exit_codes.size()));
    }
    for (const int code : record.exit_codes) {
      if (code != batchexec::core::errors::ToInt(batchexec::core::errors::ExitCode::kFatal)) {
        Fail("escalation must carry the fatal exit code");
      }
    }
    AssertContains(record.messages[0], "UNKNOWN_ATTRIBUTE");
    AssertContains(record.messages[2], "no such LoV exists [no_such_lov]");
    AssertContains(record.messages[3], "explicit failure");

    const std::string logged = sink.str();
    AssertContains(logged, "level=ERROR");
    AssertContains(logged, "FATAL explicit failure");
  }

  // A valid set never reaches the handler regardless of mode.
  {
    std::ostringstream sink;
    batchexec::lov::EnumRegistry registry;
    TerminateRecord record;
    Executive exec(OptionsFor("1", sink, registry, record));
    if (exec.Set("echo", std::string("1")) != 0 || !exec.Echo()) {
      Fail("valid boolean set should succeed");
    }
    if (!record.exit_codes.empty()) {
      Fail("successful operations must not escalate");
    }
  }

  return 0;
}
