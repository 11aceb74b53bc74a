#include "sandbox/engine.hpp"
#include <glog/logging.h>
#include <chrono>

namespace sandbox {
using namespace std;

static const engine_config &validated(const engine_config &config) {
    config.validate();
    return config;
}

execution_engine::execution_engine(const engine_config &config)
    : execution_engine(config, make_unique<posix_process_runner>(chrono::milliseconds(config.sample_interval), config.output_limit)) {}

execution_engine::execution_engine(const engine_config &config, unique_ptr<process_runner> runner)
    : config(validated(config)),
      precheck(config.max_source_size, config.max_loop_count),
      workspaces(config.workspace_root),
      runner(move(runner)),
      builder(*this->runner, config.compile_time_limit),
      orchestrator(this->config, registry, precheck, workspaces, *this->runner, builder),
      tests(orchestrator),
      slots(config.max_concurrent_executions) {
    LOG(INFO) << "Execution engine ready, workspace root " << workspaces.root()
              << ", " << registry.profiles().size() << " languages";
}

execution_result execution_engine::execute(const code_submission &submission) {
    concurrent_slots::guard slot(slots);
    return orchestrator.execute(submission);
}

vector<test_result> execution_engine::run_tests(const string &code,
                                                const string &language,
                                                const vector<test_case> &cases,
                                                const optional<int> &timeout_seconds,
                                                const optional<int> &memory_limit_mb) {
    concurrent_slots::guard slot(slots);
    return tests.run_tests(code, language, cases, timeout_seconds, memory_limit_mb);
}

vector<language_summary> execution_engine::list_supported_languages() const {
    return registry.summaries();
}

const engine_config &execution_engine::get_config() const {
    return config;
}

void to_json(nlohmann::json &j, const language_summary &summary) {
    j = {{"language", summary.language},
         {"name", summary.name},
         {"extension", summary.extension},
         {"timeout", summary.timeout},
         {"compiled", summary.compiled}};
}

}  // namespace sandbox
