#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "sandbox/engine.hpp"
using namespace std;
using namespace nlohmann;

/**
 * @brief 读取请求文件，路径为 - 时从 stdin 读取
 */
static json read_request(const string &path) {
    if (path == "-") return json::parse(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());

    ifstream fin(path);
    if (!fin) throw invalid_argument("Unable to open request file " + path);
    return json::parse(fin);
}

static void print_response(const json &response) {
    cout << response.dump(2, ' ', false, json::error_handler_t::replace) << endl;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-cli options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("languages", "list supported languages")
        ("execute", po::value<string>(), "execute the submission in the given JSON file ('-' for stdin): {code, language, input, timeout_seconds, memory_limit_mb}")
        ("test", po::value<string>(), "run test cases in the given JSON file ('-' for stdin): {code, language, test_cases, timeout_seconds, memory_limit_mb}")
        ("config", po::value<string>(), "load engine configuration from JSON file")
        ("workspace-root", po::value<string>(), "set the directory to create execution workspaces in. You can either pass it from environ SANDBOX_WORKSPACE_ROOT")
        ("compile-time-limit", po::value<int>(), "set time limit in seconds for compilers, default to 30. You can either pass it from environ SANDBOX_COMPILE_TIME_LIMIT")
        ("max-source-size", po::value<size_t>(), "set maximum source code size in bytes, default to 50000. You can either pass it from environ SANDBOX_MAX_SOURCE_SIZE")
        ("max-loops", po::value<int>(), "set maximum number of for/while keywords, default to 10. You can either pass it from environ SANDBOX_MAX_LOOP_COUNT")
        ("sample-interval", po::value<int>(), "set memory sampling interval in milliseconds, default to 100. You can either pass it from environ SANDBOX_SAMPLE_INTERVAL")
        ("output-limit", po::value<size_t>(), "set maximum captured bytes of stdout and stderr each, default to 16777216. You can either pass it from environ SANDBOX_OUTPUT_LIMIT")
        ("max-concurrent", po::value<size_t>(), "set maximum number of concurrent executions, 0 for unlimited. You can either pass it from environ SANDBOX_MAX_CONCURRENT")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "SandboxEngine: Run untrusted code snippets with time and memory limits" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-engine 1.0" << endl;
        return EXIT_SUCCESS;
    }

    sandbox::engine_config config;
    try {
        if (vm.count("config"))
            sandbox::load_config_file(config, vm.at("config").as<string>());
        sandbox::load_config_env(config);
    } catch (invalid_argument &ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("workspace-root"))
        config.workspace_root = vm.at("workspace-root").as<string>();
    if (vm.count("compile-time-limit"))
        config.compile_time_limit = vm.at("compile-time-limit").as<int>();
    if (vm.count("max-source-size"))
        config.max_source_size = vm.at("max-source-size").as<size_t>();
    if (vm.count("max-loops"))
        config.max_loop_count = vm.at("max-loops").as<int>();
    if (vm.count("sample-interval"))
        config.sample_interval = vm.at("sample-interval").as<int>();
    if (vm.count("output-limit"))
        config.output_limit = vm.at("output-limit").as<size_t>();
    if (vm.count("max-concurrent"))
        config.max_concurrent_executions = vm.at("max-concurrent").as<size_t>();

    unique_ptr<sandbox::execution_engine> engine;
    try {
        engine = make_unique<sandbox::execution_engine>(config);
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to start execution engine: " << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("languages")) {
        print_response(engine->list_supported_languages());
    } else if (vm.count("execute")) {
        sandbox::code_submission submission;
        try {
            read_request(vm.at("execute").as<string>()).get_to(submission);
        } catch (exception &ex) {
            cerr << "Malformed submission: " << ex.what() << endl;
            return EXIT_FAILURE;
        }
        print_response(engine->execute(submission));
    } else if (vm.count("test")) {
        sandbox::code_submission submission;
        vector<sandbox::test_case> cases;
        try {
            json request = read_request(vm.at("test").as<string>());
            request.get_to(submission);
            request.at("test_cases").get_to(cases);
        } catch (exception &ex) {
            cerr << "Malformed test request: " << ex.what() << endl;
            return EXIT_FAILURE;
        }
        print_response(engine->run_tests(submission.code, submission.language, cases,
                                         submission.timeout_seconds, submission.memory_limit_mb));
    } else {
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
