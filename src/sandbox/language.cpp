#include "sandbox/language.hpp"
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

bool language_profile::is_compiled() const {
    return holds_alternative<compiled>(strategy);
}

language_profile make_profile(language id) {
    language_profile profile;
    profile.id = id;
    profile.encoding = "utf-8";
    switch (id) {
        case language::PYTHON:
            profile.key = "python";
            profile.aliases = {"py", "python3"};
            profile.name = "Python 3";
            profile.extension = ".py";
            // -u 关闭输出缓冲，超时被杀死时也能拿到已经输出的内容
            profile.strategy = interpreted{{"python3", "-u", "{file}"}};
            profile.timeout = 10;
            profile.disallowed_patterns = {
                R"(import\s+os)",
                R"(import\s+subprocess)",
                R"(import\s+sys)",
                R"(__import__)",
                R"(eval\s*\()",
                R"(exec\s*\()",
                R"(open\s*\()",
                R"(file\s*\()"};
            break;
        case language::JAVASCRIPT:
            profile.key = "javascript";
            profile.aliases = {"js", "node"};
            profile.name = "JavaScript (Node.js)";
            profile.extension = ".js";
            profile.strategy = interpreted{{"node", "{file}"}};
            profile.timeout = 10;
            profile.disallowed_patterns = {
                R"(require\s*\(\s*["']fs["'])",
                R"(require\s*\(\s*["']child_process["'])",
                R"(eval\s*\()",
                R"(Function\s*\()",
                R"(process\.exit)"};
            break;
        case language::JAVA:
            profile.key = "java";
            profile.name = "Java 11";
            profile.extension = ".java";
            // 单文件源代码模式，不需要单独的编译步骤
            profile.strategy = interpreted{{"java", "--source", "11", "{file}"}};
            profile.timeout = 15;
            profile.disallowed_patterns = {
                R"(import\s+java\.io)",
                R"(import\s+java\.nio)",
                R"(Runtime\.getRuntime)",
                R"(ProcessBuilder)",
                R"(System\.exit)"};
            break;
        case language::CPP:
            profile.key = "cpp";
            profile.aliases = {"c++", "cxx"};
            profile.name = "C++ 17";
            profile.extension = ".cpp";
            profile.strategy = compiled{{"g++", "-o", "{executable}", "{file}", "-std=c++17"}, {"{executable}"}};
            profile.timeout = 15;
            profile.disallowed_patterns = {
                R"(#include\s*<cstdlib>)",
                R"(#include\s*<fstream>)",
                R"(system\s*\()",
                R"(exec\s*\()"};
            break;
    }
    return profile;
}

vector<string> expand_command(const vector<string> &command_template, const map<string, string> &placeholders) {
    vector<string> command;
    for (const string &arg : command_template) {
        string expanded = arg;
        for (auto &[name, value] : placeholders)
            boost::algorithm::replace_all(expanded, "{" + name + "}", value);
        command.push_back(expanded);
    }
    return command;
}

language_registry::language_registry()
    : language_registry({make_profile(language::PYTHON),
                         make_profile(language::JAVASCRIPT),
                         make_profile(language::JAVA),
                         make_profile(language::CPP)}) {}

language_registry::language_registry(vector<language_profile> profiles)
    : table(move(profiles)) {
    for (size_t i = 0; i < table.size(); ++i) {
        vector<string> keys = table[i].aliases;
        keys.push_back(table[i].key);
        for (auto &key : keys) {
            auto [it, inserted] = index.emplace(boost::algorithm::to_lower_copy(key), i);
            if (!inserted)
                throw invalid_argument("Duplicated language key " + key);
        }
    }
}

const language_profile *language_registry::find(const string &key) const {
    auto it = index.find(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(key)));
    if (it == index.end()) return nullptr;
    return &table[it->second];
}

const language_profile &language_registry::lookup(const string &key) const {
    const language_profile *profile = find(key);
    if (!profile) throw unsupported_language(key);
    return *profile;
}

vector<language_summary> language_registry::summaries() const {
    vector<language_summary> result;
    for (auto &profile : table)
        result.push_back({profile.key, profile.name, profile.extension, profile.timeout, profile.is_compiled()});
    return result;
}

const vector<language_profile> &language_registry::profiles() const {
    return table;
}

}  // namespace sandbox
