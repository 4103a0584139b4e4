#include "judge/report.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string/trim.hpp>
#include <fstream>
#include <map>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const verdict &v) {
    j = {{"verdict", get_display_message(v.kind)},
         {"test", v.test},
         {"message", v.message},
         {"detail", v.detail},
         {"candidates", v.candidates},
         {"time", v.time}};
}

void to_json(json &j, const group_result &result) {
    j = {{"group", result.group.name},
         {"root", result.group.root.string()},
         {"verdicts", result.verdicts}};
    if (result.group.number) j["number"] = *result.group.number;
    else j["number"] = nullptr;
}

string format_verdict(const string &group, const verdict &v) {
    string text = v.test.empty()
                      ? fmt::format("[{}] {}", group, get_display_message(v.kind))
                      : fmt::format("[{}] {}: {}", group, v.test, get_display_message(v.kind));
    if (!v.message.empty()) text += " - " + v.message;
    if (v.time > 0) text += fmt::format(" ({:.2f}s)", v.time);
    text += '\n';

    for (auto &candidate : v.candidates)
        text += "    * " + candidate + '\n';
    if (!boost::algorithm::trim_copy(v.detail).empty())
        for (auto &line : split_lines(v.detail))
            text += "    " + line + '\n';
    return text;
}

void print_group(ostream &os, const group_result &result) {
    for (auto &v : result.verdicts)
        os << format_verdict(result.group.name, v);
    os.flush();
}

void print_summary(ostream &os, const vector<group_result> &results) {
    size_t total = 0, passed = 0, perfect = 0;
    map<verdict_kind, size_t> failures;
    for (auto &result : results) {
        bool all_passed = !result.verdicts.empty();
        for (auto &v : result.verdicts) {
            ++total;
            if (v.passed()) ++passed;
            else ++failures[v.kind], all_passed = false;
        }
        if (all_passed) ++perfect;
    }

    os << fmt::format("{} groups graded, {} passed every test; {}/{} verdicts passed\n",
                      results.size(), perfect, passed, total);
    for (auto &[kind, count] : failures)
        os << fmt::format("    {}: {}\n", get_display_message(kind), count);
}

void export_results(const filesystem::path &file, const vector<group_result> &results) {
    ofstream fout(file);
    if (!fout) throw configuration_error(fmt::format("unable to write results to {}", file.string()));
    json j = results;
    fout << j.dump(2) << endl;
}

}  // namespace grader
