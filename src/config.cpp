#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <stdexcept>
#include "common/utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

engine_config::engine_config()
    : workspace_root(filesystem::temp_directory_path() / "sandbox_execution") {}

void engine_config::validate() const {
    if (workspace_root.empty())
        throw invalid_argument("workspace root should not be empty");
    if (compile_time_limit <= 0)
        throw invalid_argument("compile time limit should be positive");
    if (max_loop_count < 0)
        throw invalid_argument("max loop count should not be negative");
    if (sample_interval <= 0)
        throw invalid_argument("memory sample interval should be positive");
    if (default_memory_limit <= 0)
        throw invalid_argument("default memory limit should be positive");
}

void from_json(const json &j, engine_config &config) {
    if (j.count("workspaceRoot"))
        config.workspace_root = j.at("workspaceRoot").get<string>();
    if (j.count("compileTimeLimit"))
        j.at("compileTimeLimit").get_to(config.compile_time_limit);
    if (j.count("maxSourceSize"))
        j.at("maxSourceSize").get_to(config.max_source_size);
    if (j.count("maxLoopCount"))
        j.at("maxLoopCount").get_to(config.max_loop_count);
    if (j.count("sampleInterval"))
        j.at("sampleInterval").get_to(config.sample_interval);
    if (j.count("outputLimit"))
        j.at("outputLimit").get_to(config.output_limit);
    if (j.count("defaultMemoryLimit"))
        j.at("defaultMemoryLimit").get_to(config.default_memory_limit);
    if (j.count("maxConcurrentExecutions"))
        j.at("maxConcurrentExecutions").get_to(config.max_concurrent_executions);
}

void to_json(json &j, const engine_config &config) {
    j = {{"workspaceRoot", config.workspace_root.string()},
         {"compileTimeLimit", config.compile_time_limit},
         {"maxSourceSize", config.max_source_size},
         {"maxLoopCount", config.max_loop_count},
         {"sampleInterval", config.sample_interval},
         {"outputLimit", config.output_limit},
         {"defaultMemoryLimit", config.default_memory_limit},
         {"maxConcurrentExecutions", config.max_concurrent_executions}};
}

void load_config_file(engine_config &config, const filesystem::path &config_path) {
    ifstream fin(config_path);
    if (!fin)
        throw invalid_argument("Unable to open configuration file " + config_path.string());
    try {
        json j;
        fin >> j;
        j.get_to(config);
    } catch (json::exception &ex) {
        throw invalid_argument("Malformed configuration file " + config_path.string() + ": " + ex.what());
    }
}

template <typename T>
static void assign_env(const char *key, T &value) {
    string env = get_env(key, "");
    if (env.empty()) return;
    try {
        value = boost::lexical_cast<T>(env);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument(string("Environment variable ") + key + " has malformed value " + env);
    }
}

void load_config_env(engine_config &config) {
    string root = get_env("SANDBOX_WORKSPACE_ROOT", "");
    if (!root.empty()) config.workspace_root = root;
    assign_env("SANDBOX_COMPILE_TIME_LIMIT", config.compile_time_limit);
    assign_env("SANDBOX_MAX_SOURCE_SIZE", config.max_source_size);
    assign_env("SANDBOX_MAX_LOOP_COUNT", config.max_loop_count);
    assign_env("SANDBOX_SAMPLE_INTERVAL", config.sample_interval);
    assign_env("SANDBOX_OUTPUT_LIMIT", config.output_limit);
    assign_env("SANDBOX_DEFAULT_MEMORY_LIMIT", config.default_memory_limit);
    assign_env("SANDBOX_MAX_CONCURRENT", config.max_concurrent_executions);
}

}  // namespace sandbox
