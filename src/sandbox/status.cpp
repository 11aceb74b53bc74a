#include "sandbox/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<error_kind, const char *> display_string = boost::assign::map_list_of
    (error_kind::NONE, "None")
    (error_kind::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (error_kind::SECURITY_REJECTED, "Security Rejected")
    (error_kind::COMPILE_ERROR, "Compile Error")
    (error_kind::RUNTIME_TIMEOUT, "Runtime Timeout")
    (error_kind::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (error_kind::PROCESS_SPAWN_ERROR, "Process Spawn Error")
    (error_kind::NON_ZERO_EXIT, "Non-Zero Exit");

static const unordered_map<error_kind, const char *> identifier_string = boost::assign::map_list_of
    (error_kind::NONE, "none")
    (error_kind::UNSUPPORTED_LANGUAGE, "unsupported_language")
    (error_kind::SECURITY_REJECTED, "security_rejected")
    (error_kind::COMPILE_ERROR, "compile_error")
    (error_kind::RUNTIME_TIMEOUT, "runtime_timeout")
    (error_kind::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (error_kind::PROCESS_SPAWN_ERROR, "process_spawn_error")
    (error_kind::NON_ZERO_EXIT, "non_zero_exit");
// clang-format on

const char *get_display_message(error_kind kind) {
    return display_string.at(kind);
}

const char *get_identifier(error_kind kind) {
    return identifier_string.at(kind);
}

error_kind parse_error_kind(const string &identifier) {
    for (auto &[kind, name] : identifier_string)
        if (identifier == name) return kind;
    throw invalid_argument("Unknown error kind " + identifier);
}

}  // namespace sandbox
