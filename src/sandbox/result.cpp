#include "sandbox/result.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cmath>

namespace sandbox {
using namespace std;
using namespace nlohmann;

execution_result execution_result::failure(error_kind kind, const string &error, const string &stderr_text) {
    execution_result result;
    result.success = false;
    result.kind = kind;
    result.error = error;
    result.stderr = stderr_text;
    return result;
}

string compile_result::diagnostics() const {
    string message = boost::algorithm::trim_copy(stderr);
    if (message.empty()) message = boost::algorithm::trim_copy(stdout);
    return message;
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"stdout", result.stdout},
         {"stderr", result.stderr},
         {"return_code", result.exit_code},
         {"execution_time_ms", result.execution_time_ms},
         {"compile_time_ms", result.compile_time_ms},
         {"memory_usage_mb", round(result.peak_memory_mb * 100) / 100},
         {"timeout", result.timeout},
         {"output_truncated", result.output_truncated},
         {"error_kind", get_identifier(result.kind)},
         {"error", result.error ? json(*result.error) : json()}};
}

void from_json(const json &j, execution_result &result) {
    j.at("success").get_to(result.success);
    j.at("stdout").get_to(result.stdout);
    j.at("stderr").get_to(result.stderr);
    j.at("return_code").get_to(result.exit_code);
    j.at("execution_time_ms").get_to(result.execution_time_ms);
    if (j.count("compile_time_ms"))
        j.at("compile_time_ms").get_to(result.compile_time_ms);
    j.at("memory_usage_mb").get_to(result.peak_memory_mb);
    j.at("timeout").get_to(result.timeout);
    if (j.count("output_truncated"))
        j.at("output_truncated").get_to(result.output_truncated);
    if (j.count("error_kind"))
        result.kind = parse_error_kind(j.at("error_kind").get<string>());
    if (j.count("error") && !j.at("error").is_null())
        result.error = j.at("error").get<string>();
    else
        result.error.reset();
}

}  // namespace sandbox
