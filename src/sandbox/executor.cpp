#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <glog/raw_logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace sandbox {
using namespace std;

execution_orchestrator::execution_orchestrator(const engine_config &config,
                                               const language_registry &registry,
                                               const security_precheck &precheck,
                                               workspace_manager &workspaces,
                                               process_runner &runner,
                                               compiler &builder)
    : config(config), registry(registry), precheck(precheck), workspaces(workspaces), runner(runner), builder(builder) {}

execution_result out_of_memory_failure() noexcept {
    execution_result result;
    result.kind = error_kind::PROCESS_SPAWN_ERROR;
    return result;
}

execution_result internal_failure(const exception &ex) noexcept {
    try {
        if (auto *se = dynamic_cast<const sandbox_exception *>(&ex))
            LOG(ERROR) << "Internal error during execution: " << *se;
        else
            LOG(ERROR) << "Internal error during execution: " << boost::diagnostic_information(ex);
        return execution_result::failure(error_kind::PROCESS_SPAWN_ERROR, fmt::format("internal error: {}", ex.what()), ex.what());
    } catch (bad_alloc &) {
        RAW_LOG(ERROR, "Out of memory while reporting internal error: %s", ex.what());
        return out_of_memory_failure();
    }
}

static execution_result compile_failure(const compile_result &compilation) {
    if (compilation.spawn_failed)
        return execution_result::failure(error_kind::PROCESS_SPAWN_ERROR,
                                         "compiler unavailable: " + compilation.diagnostics(),
                                         compilation.stderr);

    auto result = execution_result::failure(error_kind::COMPILE_ERROR,
                                            "compilation failed: " + compilation.diagnostics(),
                                            "Compilation failed: " + compilation.stderr);
    result.stdout = compilation.stdout;
    result.exit_code = compilation.exit_code;
    result.compile_time_ms = compilation.compile_time_ms;
    result.timeout = compilation.timeout;
    return result;
}

variant<prepared_program, execution_result> execution_orchestrator::prepare(const string &code, const string &language) {
    const language_profile *profile;
    try {
        profile = &registry.lookup(language);
    } catch (unsupported_language &ex) {
        LOG(WARNING) << "Rejected submission: " << ex.what();
        return execution_result::failure(error_kind::UNSUPPORTED_LANGUAGE, ex.what(),
                                         fmt::format("Language {} not supported", ex.language));
    }

    vector<violation> violations = precheck.check(code, *profile);
    if (!violations.empty()) {
        vector<string> messages;
        for (auto &v : violations) messages.push_back(v.message());
        string error = "security check failed: " + boost::algorithm::join(messages, "; ");
        LOG(WARNING) << "Rejected " << profile->name << " submission: " << error;
        return execution_result::failure(error_kind::SECURITY_REJECTED, error, "Security check failed");
    }

    prepared_program program;
    program.profile = profile;
    program.ws = workspaces.acquire(*profile, code);

    return visit(overloaded{
                     [&](const interpreted &strategy) -> variant<prepared_program, execution_result> {
                         program.run_command = expand_command(strategy.run_command,
                                                              {{"file", program.ws.source_file().string()}});
                         return move(program);
                     },
                     [&](const compiled &strategy) -> variant<prepared_program, execution_result> {
                         compile_result compilation = builder.compile(program.ws, *profile);
                         if (!compilation.success) return compile_failure(compilation);

                         program.compile_time_ms = compilation.compile_time_ms;
                         program.run_command = expand_command(strategy.run_command,
                                                              {{"file", program.ws.source_file().string()},
                                                               {"executable", program.ws.executable_file().string()}});
                         return move(program);
                     }},
                 profile->strategy);
}

execution_result execution_orchestrator::run(const prepared_program &program, const string &input, int timeout_seconds, int memory_limit_mb) {
    process_request request;
    request.command = program.run_command;
    request.stdin_data = input;
    request.timeout_seconds = timeout_seconds;
    request.memory_limit_mb = memory_limit_mb;
    request.working_directory = program.ws.dir();

    execution_result result = runner.run(request);
    result.compile_time_ms = program.compile_time_ms;
    return result;
}

int execution_orchestrator::resolve_timeout(const language_profile &profile, const optional<int> &timeout_seconds) const {
    return timeout_seconds && *timeout_seconds > 0 ? *timeout_seconds : profile.timeout;
}

int execution_orchestrator::resolve_memory_limit(const optional<int> &memory_limit_mb) const {
    return memory_limit_mb && *memory_limit_mb > 0 ? *memory_limit_mb : config.default_memory_limit;
}

execution_result execution_orchestrator::execute(const code_submission &submission) noexcept {
    try {
        auto prepared = prepare(submission.code, submission.language);
        if (auto *failed = get_if<execution_result>(&prepared)) return *failed;

        auto &program = get<prepared_program>(prepared);
        execution_result result = run(program,
                                      submission.input.value_or(""),
                                      resolve_timeout(*program.profile, submission.timeout_seconds),
                                      resolve_memory_limit(submission.memory_limit_mb));
        workspaces.release(program.ws);
        return result;
    } catch (exception &ex) {
        return internal_failure(ex);
    }
}

}  // namespace sandbox
