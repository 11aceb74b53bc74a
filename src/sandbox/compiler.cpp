#include "sandbox/compiler.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace sandbox {
using namespace std;

compiler::compiler(process_runner &runner, int compile_time_limit)
    : runner(runner), compile_time_limit(compile_time_limit) {}

compile_result compiler::compile(const workspace &ws, const language_profile &profile) {
    auto *strategy = get_if<compiled>(&profile.strategy);
    if (!strategy) throw invalid_argument("language " + profile.key + " has no compile step");

    process_request request;
    request.command = expand_command(strategy->compile_command,
                                     {{"file", ws.source_file().string()},
                                      {"executable", ws.executable_file().string()}});
    request.timeout_seconds = compile_time_limit;
    request.working_directory = ws.dir();

    LOG(INFO) << "Compiling " << ws.id() << " [" << profile.name << "]";
    execution_result run = runner.run(request);

    compile_result result;
    result.stdout = run.stdout;
    result.stderr = run.stderr;
    result.exit_code = run.exit_code;
    result.compile_time_ms = run.execution_time_ms;
    result.timeout = run.timeout;
    result.spawn_failed = run.kind == error_kind::PROCESS_SPAWN_ERROR;
    result.success = run.success;

    if (result.timeout)
        result.stderr += "\nCompilation timed out after " + to_string(compile_time_limit) + "s";

    if (result.spawn_failed)
        LOG(ERROR) << "Unable to start compiler for " << ws.id() << ": " << run.error.value_or("");
    else if (!result.success)
        LOG(INFO) << "Compilation of " << ws.id() << " failed with exit code " << result.exit_code;
    else
        LOG(INFO) << "Compilation of " << ws.id() << " finished in " << result.compile_time_ms << "ms";
    return result;
}

}  // namespace sandbox
