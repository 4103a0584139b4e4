#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <mutex>
#include <set>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/assignment.hpp"
#include "judge/report.hpp"
#include "judge/simulator_judger.hpp"
#include "judge/submission.hpp"
#include "judge/tm_judger.hpp"
#include "language/language.hpp"
#include "sandbox/sandbox.hpp"
#include "worker.hpp"
using namespace std;

namespace po = boost::program_options;

/**
 * @brief 读取命令行参数，没有指定时读取环境变量，值为空的环境变量视为未设置
 * @return 是否找到了参数或者环境变量
 */
template <typename T>
static bool read_option(const po::variables_map& vm, const char* option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
        return true;
    }
    string env_value = grader::get_env(env, "");
    if (env_value.empty()) return false;
    value = boost::lexical_cast<T>(env_value);
    return true;
}

static unique_ptr<grader::judger> make_judger(const string& mode,
                                              grader::assignment config,
                                              const grader::language_registry& registry,
                                              unique_ptr<grader::sandbox_context>& context,
                                              const grader::sandbox_limits& limits,
                                              const string& sandbox_name,
                                              grader::command_override overrides,
                                              const grader::tm::tm_limits& tm_limits) {
    if (mode == "tms")
        return make_unique<grader::tm_judger>(move(config), tm_limits);

    context = grader::sandbox_context::acquire(grader::make_sandbox(sandbox_name, limits, grader::WORK_DIR));
    return make_unique<grader::simulator_judger>(move(config), registry, *context, move(overrides), tm_limits);
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("autograder options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("mode", po::value<string>(), "assignment type: simulators (programs simulating Turing machines) or tms (Turing machine descriptions)")
        ("path", po::value<string>(), "directory containing one sub-directory or zip file per group")
        ("group,g", po::value<vector<int>>(), "grade only the given group number, can be repeated")
        ("build-command,b", po::value<string>(), "override the detected build command, intended for a single group selected with -g")
        ("run-command,r", po::value<string>(), "override the detected run command, the test arguments are appended")
        ("entrypoint,e", po::value<string>(), "entrypoint file relative to the group directory, used when several candidates exist")
        ("config", po::value<string>(), "assignment configuration file, defaults to <path>/assignment.json when it exists")
        ("languages", po::value<string>(), "language profile file replacing the built-in table")
        ("sandbox", po::value<string>()->default_value("local"), "sandbox backend: local or docker")
        ("workers", po::value<size_t>(), "number of groups graded concurrently, defaults to the number of CPUs")
        ("time-limit", po::value<double>(), "time limit in seconds for each run, default to 5. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<size_t>(), "memory limit in KB for each run, default to 1048576(1GB). You can either pass it from environ MEMLIMIT")
        ("stream-size", po::value<size_t>(), "bytes of stdout and stderr kept for each run, default to 1048576. You can either pass it from environ STREAMSIZE")
        ("step-limit", po::value<size_t>(), "maximum number of Turing machine steps, default to 1000000. You can either pass it from environ STEPLIMIT")
        ("tm-dir", po::value<string>(), "directory with the reference Turing machines used when no configuration file is given")
        ("work-dir", po::value<string>(), "directory for extracted submissions and sandbox workspaces. You can either pass it from environ WORKDIR")
        ("json", po::value<string>(), "also write all verdicts to this JSON file")
        ("debug", "keep sandbox workspaces and containers for inspection")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("mode", 1).add("path", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "autograder: grade Turing machine simulators and Turing machine descriptions of student groups" << endl
             << "Usage: " << argv[0] << " simulators|tms <path> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "autograder 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (!vm.count("mode") || !vm.count("path")) {
        cerr << "Usage: " << argv[0] << " simulators|tms <path> [options]" << endl;
        return EXIT_FAILURE;
    }
    string mode = vm.at("mode").as<string>();
    if (mode != "simulators" && mode != "tms") {
        cerr << "Unknown assignment type " << mode << ", expected simulators or tms" << endl;
        return EXIT_FAILURE;
    }
    filesystem::path root(vm.at("path").as<string>());

    try {
        if (vm.count("debug") || !grader::get_env("DEBUG", "").empty()) grader::DEBUG = true;

        bool time_given = read_option(vm, "time-limit", "TIMELIMIT", grader::TIME_LIMIT);
        bool memory_given = read_option(vm, "memory-limit", "MEMLIMIT", grader::MEMORY_LIMIT);
        read_option(vm, "stream-size", "STREAMSIZE", grader::STREAM_SIZE);
        bool step_given = read_option(vm, "step-limit", "STEPLIMIT", grader::STEP_LIMIT);

        string work_dir;
        if (read_option(vm, "work-dir", "WORKDIR", work_dir)) grader::WORK_DIR = work_dir;
        if (vm.count("tm-dir")) grader::TM_DIR = vm.at("tm-dir").as<string>();

        grader::assignment config;
        filesystem::path config_file = vm.count("config") ? filesystem::path(vm.at("config").as<string>()) : root / "assignment.json";
        if (vm.count("config") || filesystem::is_regular_file(config_file)) {
            config = grader::load_assignment(config_file);
            if (vm.count("tm-dir")) config.tm_dir = filesystem::absolute(grader::TM_DIR);
        } else {
            config = grader::default_assignment(grader::TM_DIR);
        }

        // 命令行和环境变量优先于作业配置
        if (config.time_limit && !time_given) grader::TIME_LIMIT = *config.time_limit;
        if (config.memory_limit && !memory_given) grader::MEMORY_LIMIT = *config.memory_limit;
        if (config.step_limit && !step_given) grader::STEP_LIMIT = *config.step_limit;

        grader::sandbox_limits limits;
        grader::tm::tm_limits tm_limits;

        grader::command_override overrides;
        if (vm.count("build-command")) overrides.build = vm.at("build-command").as<string>();
        if (vm.count("run-command")) overrides.run = vm.at("run-command").as<string>();
        if (vm.count("entrypoint")) overrides.entrypoint = filesystem::path(vm.at("entrypoint").as<string>());

        set<int> numbers;
        if (vm.count("group"))
            for (int number : vm.at("group").as<vector<int>>()) numbers.insert(number);

        auto groups = grader::filter_groups(grader::discover_submissions(root, grader::WORK_DIR), numbers);
        if (groups.empty())
            throw grader::configuration_error("none of the requested groups was found in " + root.string());
        if ((overrides.has_commands() || overrides.entrypoint) && groups.size() > 1)
            LOG(WARNING) << "Command overrides apply to all " << groups.size() << " groups, select a single group with -g";

        grader::language_registry registry = vm.count("languages")
                                                 ? grader::load_language_registry(vm.at("languages").as<string>())
                                                 : grader::language_registry::builtin();

        unique_ptr<grader::sandbox_context> context;
        auto j = make_judger(mode, move(config), registry, context, limits, vm.at("sandbox").as<string>(), move(overrides), tm_limits);

        size_t workers = vm.count("workers") ? vm.at("workers").as<size_t>() : grader::default_worker_count();
        LOG(INFO) << "Grading " << groups.size() << " groups of " << j->type() << " with " << workers << " workers";

        // 小组的输出不能交错
        mutex print_mut;
        grader::results_sink sink([&print_mut](const grader::group_result& result) {
            scoped_lock guard(print_mut);
            grader::print_group(cout, result);
        });
        grader::grade_groups(*j, groups, workers, sink);

        auto results = sink.results();
        cout << endl;
        grader::print_summary(cout, results);

        if (vm.count("json"))
            grader::export_results(vm.at("json").as<string>(), results);
    } catch (grader::grader_exception& ex) {
        LOG(ERROR) << ex;
        cerr << "Fatal: " << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (boost::bad_lexical_cast& ex) {
        cerr << "Invalid value in environment variable: " << ex.what() << endl;
        return EXIT_FAILURE;
    } catch (exception& ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << "Fatal: " << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
