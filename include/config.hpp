#pragma once

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace sandbox {

/**
 * @brief 执行引擎的配置
 * 配置的加载顺序为：默认值 -> JSON 配置文件 -> 环境变量 -> 命令行参数，
 * 后加载的覆盖先加载的。配置对象在启动时构造一次，之后以 const 引用注入各个组件。
 */
struct engine_config {
    /**
     * @brief 存放所有工作区的根目录
     * 每次执行都会在这个目录下创建一个唯一命名的子目录，执行结束后删除。
     * 若将这个目录放进内存盘，可以加速选手程序的 IO。
     * @defaultValue <系统临时目录>/sandbox_execution
     *
     * workspace_root
     * ├── exec_1700000000000_4242_1f2e3d4c // 一次执行的工作区
     * │   ├── main.cpp // 用户提交的源代码
     * │   └── main.out // 编译产物（仅编译型语言）
     * └── ...
     */
    std::filesystem::path workspace_root;

    /**
     * @brief 编译步骤的时间上限（秒）
     * 与用户指定的运行时间限制相互独立，编译器卡死不会消耗用户的运行时间
     */
    int compile_time_limit = 30;

    /**
     * @brief 源代码的最大字节数，超过后安全检查失败
     */
    std::size_t max_source_size = 50000;

    /**
     * @brief 源代码中允许出现的 for/while 关键字数量上限
     */
    int max_loop_count = 10;

    /**
     * @brief 内存监控的采样间隔（毫秒）
     */
    int sample_interval = 100;

    /**
     * @brief stdout、stderr 各自最多保留的字节数，超出部分读取后丢弃
     */
    std::size_t output_limit = 16 << 20;

    /**
     * @brief 提交未指定内存限制时使用的内存限制（MB）
     */
    int default_memory_limit = 128;

    /**
     * @brief 同时执行的提交数量上限，0 表示不限制
     */
    std::size_t max_concurrent_executions = 0;

    engine_config();

    /**
     * @brief 检查配置是否合法
     * @throw std::invalid_argument 某一项配置的取值不合法
     */
    void validate() const;
};

/**
 * @brief 从 JSON 对象读取配置，缺失的键保持原值
 */
void from_json(const nlohmann::json &j, engine_config &config);

void to_json(nlohmann::json &j, const engine_config &config);

/**
 * @brief 读取 JSON 配置文件并覆盖 config 中对应的项
 * @param config 要被覆盖的配置
 * @param config_path JSON 配置文件路径
 * @throw std::invalid_argument 配置文件不存在或者不是合法的 JSON
 */
void load_config_file(engine_config &config, const std::filesystem::path &config_path);

/**
 * @brief 使用 SANDBOX_ 开头的环境变量覆盖配置
 * SANDBOX_WORKSPACE_ROOT, SANDBOX_COMPILE_TIME_LIMIT, SANDBOX_MAX_SOURCE_SIZE,
 * SANDBOX_MAX_LOOP_COUNT, SANDBOX_SAMPLE_INTERVAL, SANDBOX_OUTPUT_LIMIT,
 * SANDBOX_DEFAULT_MEMORY_LIMIT, SANDBOX_MAX_CONCURRENT
 */
void load_config_env(engine_config &config);

}  // namespace sandbox
