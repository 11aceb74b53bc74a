#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/concurrent_slots.hpp"
#include "config.hpp"
#include "sandbox/compiler.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/language.hpp"
#include "sandbox/process.hpp"
#include "sandbox/security.hpp"
#include "sandbox/submission.hpp"
#include "sandbox/test_runner.hpp"
#include "sandbox/workspace.hpp"

namespace sandbox {

/**
 * @brief 执行引擎的对外接口
 * 持有全部组件。execute 和 run_tests 可以在多个线程中并发调用，
 * 配置了 max_concurrent_executions 时超出上限的调用会阻塞等待。
 */
struct execution_engine {
    /**
     * @param config 引擎配置，构造时会调用 validate
     * @throw std::invalid_argument 配置不合法
     */
    explicit execution_engine(const engine_config &config);

    /**
     * @brief 使用指定的进程运行器构造引擎，一般用于测试
     */
    execution_engine(const engine_config &config, std::unique_ptr<process_runner> runner);

    execution_result execute(const code_submission &submission);

    std::vector<test_result> run_tests(const std::string &code,
                                       const std::string &language,
                                       const std::vector<test_case> &cases,
                                       const std::optional<int> &timeout_seconds,
                                       const std::optional<int> &memory_limit_mb = std::nullopt);

    std::vector<language_summary> list_supported_languages() const;

    const engine_config &get_config() const;

private:
    engine_config config;
    language_registry registry;
    security_precheck precheck;
    workspace_manager workspaces;
    std::unique_ptr<process_runner> runner;
    compiler builder;
    execution_orchestrator orchestrator;
    test_case_runner tests;
    concurrent_slots slots;
};

void to_json(nlohmann::json &j, const language_summary &summary);

}  // namespace sandbox
