#include "judge/simulator_judger.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <boost/algorithm/string/join.hpp>
#include <cstring>
#include <map>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;

string describe_exit(const execution_result &result) {
    if (result.signal != 0)
        return fmt::format("killed by signal {} ({})", result.signal, strsignal(result.signal));
    return fmt::format("exited with code {}", result.exit_code);
}

static string with_truncation_note(string text, bool truncated) {
    if (truncated) text += "\n[output truncated]";
    return text;
}

simulator_judger::simulator_judger(assignment config, const language_registry &registry, sandbox_context &context,
                                   command_override overrides, const tm::tm_limits &limits)
    : config(move(config)), registry(registry), context(context), overrides(move(overrides)) {
    map<string, tm::tm_description> machines;
    for (auto &test : this->config.tests) {
        if (!machines.count(test.tm)) machines.emplace(test.tm, load_reference_tm(this->config, test.tm));
        const tm::tm_description &machine = machines.at(test.tm);

        tm::tm_run run = tm::simulate(machine, test.input, limits, true);
        if (run.outcome != tm::tm_outcome::ACCEPT && run.outcome != tm::tm_outcome::REJECT)
            throw configuration_error(fmt::format("reference Turing machine {} does not halt on input '{}': {}",
                                                  test.tm, test.input, tm::get_display_message(run.outcome)));

        vector<string> lines;
        for (auto &snapshot : run.trace) lines.push_back(snapshot.to_string());

        prepared_test prepared;
        prepared.name = test.name();
        for (auto &arg : this->config.args) prepared.args.push_back(expand_test_template(arg, test));
        if (this->config.stdin_template) prepared.stdin_data = expand_test_template(*this->config.stdin_template, test);
        prepared.expected = boost::algorithm::join(lines, "\n") + "\n";
        prepared.schema = output_schema::configurations(machine.tape_alphabet, machine.blank);
        tests.push_back(move(prepared));
    }
}

string simulator_judger::type() const {
    return "simulators";
}

verdict simulator_judger::judge_run(const prepared_test &test, const execution_result &result) const {
    verdict v;
    if (result.status == execution_status::TIMED_OUT) {
        v = make_verdict(verdict_kind::TIMEOUT, test.name,
                         fmt::format("killed after exceeding the time limit of {:.1f} seconds", context.backend().get_limits().time_limit),
                         with_truncation_note(result.out, result.out_truncated));
    } else if (result.exit_code != 0) {
        v = make_verdict(verdict_kind::RUNTIME_FAILURE, test.name, describe_exit(result),
                         with_truncation_note(result.err, result.err_truncated));
    } else {
        reconcile_result r = reconcile(test.schema, test.expected, result.out);
        switch (r.status) {
            case reconcile_status::PASS:
                v = make_verdict(verdict_kind::PASS, test.name, r.normalized ? "correct after normalizing whitespace" : "correct");
                break;
            case reconcile_status::FORMAT_MISMATCH:
                v = make_verdict(verdict_kind::FORMAT_MISMATCH, test.name,
                                 result.out_truncated ? "incorrect configurations (output truncated)" : "incorrect configurations",
                                 r.diff);
                break;
            case reconcile_status::UNPARSEABLE:
                v = make_verdict(verdict_kind::UNPARSEABLE, test.name, "output is not a sequence of configurations",
                                 fmt::format("{}\n--- diff ---\n{}", with_truncation_note(r.raw, result.out_truncated), r.diff));
                break;
        }
    }
    v.time = result.wall_time;
    return v;
}

vector<verdict> simulator_judger::judge(const submission_group &group) {
    auto resolved = resolve_entrypoint(registry, group.root, group.files, overrides);
    if (auto failure = get_if<entrypoint_failure>(&resolved)) {
        verdict v = make_verdict(failure->kind, "", failure->reason);
        for (auto &candidate : failure->candidates) v.candidates.push_back(candidate.string());
        return {v};
    }
    const execution_plan &plan = get<execution_plan>(resolved);
    LOG(INFO) << "Group " << group.name << ": " << plan.language.id << " program with entrypoint " << plan.entrypoint;

    auto session = context.open(group.name, group.root, config.tm_dir, plan);

    execution_result build = session->build();
    if (build.status == execution_status::BUILD_FAILED) {
        verdict v = make_verdict(verdict_kind::BUILD_FAILURE, "", fmt::format("build {}", describe_exit(build)),
                                 with_truncation_note(build.err, build.err_truncated));
        v.time = build.wall_time;
        return {v};
    }

    vector<verdict> verdicts;
    for (auto &test : tests) {
        execution_result result = session->run(test.args, test.stdin_data);
        verdicts.push_back(judge_run(test, result));
    }
    return verdicts;
}

}  // namespace grader
