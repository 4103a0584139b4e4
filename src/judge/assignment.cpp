#include "judge/assignment.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "tm/parser.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

string tm_test::name() const {
    return input.empty() ? tm + " (empty input)" : tm + " " + input;
}

void from_json(const json &j, tm_test &test) {
    j.at("tm").get_to(test.tm);
    j.at("input").get_to(test.input);
    if (j.count("expect") && !j.at("expect").is_null()) {
        string expect = to_lower(j.at("expect").get<string>());
        if (expect != "accept" && expect != "reject")
            throw configuration_error(fmt::format("test {} expects '{}', must be accept or reject", test.tm, expect));
        test.expect = expect;
    }
    if (j.count("output") && !j.at("output").is_null())
        test.output = j.at("output").get<string>();
}

void from_json(const json &j, assignment &config) {
    if (j.count("tm_dir"))
        config.tm_dir = j.at("tm_dir").get<string>();
    if (j.count("time_limit"))
        config.time_limit = j.at("time_limit").get<double>();
    if (j.count("memory_limit"))
        config.memory_limit = j.at("memory_limit").get<size_t>();
    if (j.count("step_limit"))
        config.step_limit = j.at("step_limit").get<size_t>();
    if (j.count("args"))
        j.at("args").get_to(config.args);
    if (j.count("stdin") && !j.at("stdin").is_null())
        config.stdin_template = j.at("stdin").get<string>();
    j.at("tests").get_to(config.tests);
}

assignment load_assignment(const fs::path &file) {
    assignment config;
    try {
        json j = json::parse(read_file_content(file));
        j.get_to(config);
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("malformed assignment file {}: {}", file.string(), e.what()));
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to read assignment file {}: {}", file.string(), e.what()));
    }

    if (config.tests.empty())
        throw configuration_error(fmt::format("assignment file {} has no tests", file.string()));
    if (config.tm_dir.empty()) config.tm_dir = "tms";
    if (config.tm_dir.is_relative()) config.tm_dir = fs::absolute(file).parent_path() / config.tm_dir;

    LOG(INFO) << "Loaded " << config.tests.size() << " tests from " << file;
    return config;
}

assignment default_assignment(const fs::path &tm_dir) {
    assignment config;
    config.tm_dir = fs::absolute(tm_dir);
    // clang-format off
    config.tests = {
        {"add", "0#0", nullopt, nullopt},
        {"add", "11#00111", nullopt, nullopt},
        {"equal", "11000#001", nullopt, nullopt},
        {"equal", "11000#101", nullopt, nullopt},
        {"equal", "101#101", nullopt, nullopt},
        {"invert", "0101", nullopt, nullopt},
        {"invert", "111", nullopt, nullopt}
    };
    // clang-format on
    return config;
}

tm::tm_description load_reference_tm(const assignment &config, const string &name) {
    fs::path file = config.tm_dir / (name + ".TM");
    string text;
    try {
        text = read_file_content(file);
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to read reference Turing machine {}: {}", file.string(), e.what()));
    }
    auto result = tm::parse_tm(text);
    if (auto error = get_if<tm::tm_parse_error>(&result))
        throw configuration_error(fmt::format("reference Turing machine {} is invalid: {}", file.string(), error->to_string()));
    return get<tm::tm_description>(move(result));
}

string expand_test_template(const string &text, const tm_test &test) {
    string result = replace_all(text, "{tm_file}", test.tm + ".TM");
    result = replace_all(result, "{tm}", test.tm);
    return replace_all(result, "{input}", test.input);
}

}  // namespace grader
