#include "judge/submission.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <map>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

optional<int> parse_group_number(const string &name) {
    // 目录名可能包含 UTF-8 字符，必须按 unsigned char 传给 isdigit
    auto is_digit = [](unsigned char c) { return isdigit(c) != 0; };
    auto begin = find_if(name.begin(), name.end(), is_digit);
    if (begin == name.end()) return nullopt;
    auto end = find_if_not(begin, name.end(), is_digit);
    string digits(begin, end);
    if (digits.size() > 9) return nullopt;
    return stoi(digits);
}

static fs::path extract_zip(const fs::path &zip, const fs::path &work_dir) {
    fs::path target = work_dir / "extracted" / zip.stem();
    error_code ec;
    fs::remove_all(target, ec);
    fs::create_directories(target);

    int exitcode = call_process("unzip", "-q", "-o", zip, "-d", target);
    if (exitcode != 0)
        LOG(ERROR) << "Unable to extract " << zip << ", unzip exited with " << exitcode;
    return target;
}

vector<submission_group> discover_submissions(const fs::path &root, const fs::path &work_dir) {
    if (!fs::is_directory(root))
        throw configuration_error(fmt::format("submission directory {} does not exist", root.string()));

    map<string, submission_group> groups;
    vector<fs::path> zips;
    for (auto &entry : fs::directory_iterator(root)) {
        if (is_ignored_entry(entry.path())) continue;
        if (entry.is_directory()) {
            string name = entry.path().filename().string();
            groups[name] = submission_group{parse_group_number(name), name, entry.path(), list_files_recursive(entry.path())};
        } else if (entry.is_regular_file() && to_lower(entry.path().extension().string()) == ".zip") {
            zips.push_back(entry.path());
        }
    }

    for (auto &zip : zips) {
        string name = zip.stem().string();
        if (groups.count(name)) {
            LOG(WARNING) << "Skipping " << zip << " because directory " << name << " already exists";
            continue;
        }
        fs::path extracted = extract_zip(zip, work_dir);
        groups[name] = submission_group{parse_group_number(name), name, extracted, list_files_recursive(extracted)};
    }

    if (groups.empty())
        throw configuration_error(fmt::format("no submissions found in {}", root.string()));

    vector<submission_group> result;
    for (auto &[name, group] : groups) result.push_back(move(group));
    stable_sort(result.begin(), result.end(), [](auto &a, auto &b) {
        // 没有编号的小组排在最后
        return a.number.value_or(INT_MAX) < b.number.value_or(INT_MAX);
    });
    LOG(INFO) << "Discovered " << result.size() << " submissions in " << root;
    return result;
}

vector<submission_group> filter_groups(vector<submission_group> groups, const set<int> &numbers) {
    if (numbers.empty()) return groups;
    vector<submission_group> result;
    for (auto &group : groups)
        if (group.number && numbers.count(*group.number)) result.push_back(move(group));
    return result;
}

}  // namespace grader
