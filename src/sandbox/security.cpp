#include "sandbox/security.hpp"
#include <fmt/core.h>
#include <boost/regex.hpp>
#include <iterator>

namespace sandbox {
using namespace std;

const char *get_policy_name(security_policy policy) {
    switch (policy) {
        case security_policy::DISALLOWED_PATTERN:
            return "disallowed-pattern";
        case security_policy::SOURCE_TOO_LARGE:
            return "source-too-large";
        case security_policy::TOO_MANY_LOOPS:
            return "too-many-loops";
    }
    return "unknown";
}

string violation::message() const {
    return fmt::format("{}: {}", get_policy_name(policy), detail);
}

bool violation::operator==(const violation &other) const {
    return policy == other.policy && detail == other.detail;
}

security_precheck::security_precheck(size_t max_source_size, int max_loop_count)
    : max_source_size(max_source_size), max_loop_count(max_loop_count) {}

vector<violation> security_precheck::check(const string &source, const language_profile &profile) const {
    static const boost::regex loop_keyword(R"(\b(for|while)\b)", boost::regex::perl | boost::regex::icase);

    vector<violation> violations;

    for (auto &pattern : profile.disallowed_patterns) {
        boost::regex matcher(pattern, boost::regex::perl | boost::regex::icase);
        if (boost::regex_search(source, matcher))
            violations.push_back({security_policy::DISALLOWED_PATTERN, "Potentially unsafe code detected: " + pattern});
    }

    if (source.size() > max_source_size)
        violations.push_back({security_policy::SOURCE_TOO_LARGE,
                              fmt::format("Code too long ({} bytes, limit {}) - potential resource abuse", source.size(), max_source_size)});

    auto loops = distance(boost::sregex_iterator(source.begin(), source.end(), loop_keyword), boost::sregex_iterator());
    if (loops > max_loop_count)
        violations.push_back({security_policy::TOO_MANY_LOOPS,
                              fmt::format("Too many loops detected ({}, limit {}) - potential infinite loop risk", loops, max_loop_count)});

    return violations;
}

}  // namespace sandbox
