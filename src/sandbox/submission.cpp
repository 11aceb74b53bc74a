#include "sandbox/submission.hpp"
#include <boost/algorithm/string/trim.hpp>

namespace sandbox {
using namespace std;
using namespace nlohmann;

bool output_matches(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

template <typename T>
static optional<T> get_optional(const json &j, const char *key) {
    if (!j.count(key) || j.at(key).is_null()) return nullopt;
    return j.at(key).get<T>();
}

void from_json(const json &j, code_submission &submission) {
    j.at("code").get_to(submission.code);
    j.at("language").get_to(submission.language);
    submission.input = get_optional<string>(j, "input");
    if (!submission.input && j.count("test_inputs") && j.at("test_inputs").is_array() && !j.at("test_inputs").empty())
        submission.input = j.at("test_inputs").at(0).get<string>();
    submission.timeout_seconds = get_optional<int>(j, "timeout_seconds");
    submission.memory_limit_mb = get_optional<int>(j, "memory_limit_mb");
}

void to_json(json &j, const code_submission &submission) {
    j = {{"code", submission.code},
         {"language", submission.language},
         {"input", submission.input ? json(*submission.input) : json()},
         {"timeout_seconds", submission.timeout_seconds ? json(*submission.timeout_seconds) : json()},
         {"memory_limit_mb", submission.memory_limit_mb ? json(*submission.memory_limit_mb) : json()}};
}

void from_json(const json &j, test_case &testcase) {
    j.at("name").get_to(testcase.name);
    testcase.input = get_optional<string>(j, "input").value_or("");
    testcase.expected_output = get_optional<string>(j, "expected_output");
    testcase.description = get_optional<string>(j, "description");
}

void to_json(json &j, const test_case &testcase) {
    j = {{"name", testcase.name},
         {"input", testcase.input},
         {"expected_output", testcase.expected_output ? json(*testcase.expected_output) : json()},
         {"description", testcase.description ? json(*testcase.description) : json()}};
}

void to_json(json &j, const test_result &result) {
    j = {{"test_case", result.test},
         {"result", result.result},
         {"passed", result.passed},
         {"output_match", result.output_match ? json(*result.output_match) : json()}};
}

}  // namespace sandbox
