#include "judge/tm_judger.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <map>
#include <variant>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "judge/reconciler.hpp"
#include "tm/parser.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

verdict_kind to_verdict_kind(tm::tm_error_kind kind) {
    switch (kind) {
        case tm::tm_error_kind::AMBIGUOUS_TRANSITION: return verdict_kind::TM_AMBIGUOUS_TRANSITION;
        case tm::tm_error_kind::UNDECLARED_SYMBOL: return verdict_kind::TM_UNDECLARED_SYMBOL;
        default: return verdict_kind::TM_PARSE_ERROR;
    }
}

static string render_outcome(const string &outcome, const optional<string> &output) {
    return output && !output->empty() ? outcome + " " + *output : outcome;
}

tm_judger::tm_judger(assignment config, const tm::tm_limits &limits) : config(move(config)), limits(limits) {
    map<string, tm::tm_description> machines;
    for (auto &test : this->config.tests) {
        prepared_test prepared{test.tm, test.name(), test.input, test.expect.value_or(""), test.output};
        if (!test.expect || !test.output) {
            if (!machines.count(test.tm)) machines.emplace(test.tm, load_reference_tm(this->config, test.tm));
            tm::tm_run run = tm::simulate(machines.at(test.tm), test.input, limits);
            if (run.outcome != tm::tm_outcome::ACCEPT && run.outcome != tm::tm_outcome::REJECT)
                throw configuration_error(fmt::format("reference Turing machine {} does not halt on input '{}': {}",
                                                      test.tm, test.input, tm::get_display_message(run.outcome)));
            if (!test.expect) prepared.expect = tm::get_display_message(run.outcome);
            if (!test.output) prepared.output = run.output;
        }
        tests.push_back(move(prepared));
    }
}

string tm_judger::type() const {
    return "tms";
}

/**
 * @brief 在提交中查找 <name>.TM，文件名不区分大小写
 * @return 所有匹配的文件，相对于提交目录
 */
static vector<fs::path> find_tm_files(const submission_group &group, const string &name) {
    vector<fs::path> matches;
    string expected = to_lower(name + ".tm");
    for (auto &file : group.files)
        if (to_lower(file.filename().string()) == expected) matches.push_back(file);
    return matches;
}

vector<verdict> tm_judger::judge(const submission_group &group) {
    // 每个图灵机只解析一次，解析失败时该图灵机的所有测试都得到同样的结果
    map<string, variant<tm::tm_description, verdict>> machines;
    auto load = [&](const string &name) -> const variant<tm::tm_description, verdict> & {
        auto it = machines.find(name);
        if (it != machines.end()) return it->second;

        vector<fs::path> files = find_tm_files(group, name);
        if (files.empty())
            return machines.emplace(name, make_verdict(verdict_kind::DISCOVERY_FAILURE, "",
                                                       fmt::format("no file named {}.TM", name))).first->second;
        if (files.size() > 1) {
            verdict v = make_verdict(verdict_kind::AMBIGUOUS_ENTRYPOINT, "",
                                     fmt::format("{} files are named {}.TM", files.size(), name));
            for (auto &file : files) v.candidates.push_back(file.string());
            return machines.emplace(name, v).first->second;
        }

        auto result = tm::parse_tm(read_file_content(group.root / files[0]));
        if (auto error = get_if<tm::tm_parse_error>(&result))
            return machines.emplace(name, make_verdict(to_verdict_kind(error->kind), "",
                                                       fmt::format("{}: {}", files[0].string(), get_display_message(error->kind)),
                                                       error->to_string())).first->second;
        LOG(INFO) << "Group " << group.name << ": parsed " << files[0];
        return machines.emplace(name, get<tm::tm_description>(move(result))).first->second;
    };

    vector<verdict> verdicts;
    for (auto &test : tests) {
        auto &machine = load(test.tm);
        if (auto failure = get_if<verdict>(&machine)) {
            verdict v = *failure;
            v.test = test.name;
            verdicts.push_back(move(v));
            continue;
        }

        elapsed_time timer;
        tm::tm_run run = tm::simulate(get<tm::tm_description>(machine), test.input, limits);
        verdict v;
        if (run.outcome == tm::tm_outcome::STEP_LIMIT_EXCEEDED) {
            v = make_verdict(verdict_kind::STEP_LIMIT_EXCEEDED, test.name,
                             fmt::format("did not halt within {} steps", limits.step_limit),
                             run.final_configuration.to_string());
        } else if (run.outcome == tm::tm_outcome::CYCLE_DETECTED) {
            v = make_verdict(verdict_kind::CYCLE_DETECTED, test.name,
                             fmt::format("configuration repeated after {} steps", run.steps),
                             run.final_configuration.to_string());
        } else {
            string expected = render_outcome(test.expect, test.output);
            string actual = render_outcome(tm::get_display_message(run.outcome), test.output ? optional<string>(run.output) : nullopt);
            reconcile_result r = reconcile(output_schema::tokens(), expected, actual);
            if (r.status == reconcile_status::PASS)
                v = make_verdict(verdict_kind::PASS, test.name, fmt::format("{} after {} steps", actual, run.steps));
            else
                v = make_verdict(verdict_kind::FORMAT_MISMATCH, test.name,
                                 fmt::format("expected '{}', got '{}'", expected, actual),
                                 fmt::format("{}final configuration: {}\n", r.diff, run.final_configuration.to_string()));
        }
        v.time = timer.seconds();
        verdicts.push_back(move(v));
    }
    return verdicts;
}

}  // namespace grader
