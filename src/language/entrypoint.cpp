#include "language/entrypoint.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const char *NAME_HINTS[] = {"", "main", "sim", "program"};

bool command_override::has_commands() const {
    return build.has_value() || run.has_value();
}

static execution_plan make_plan(const language_registry &registry, const vector<fs::path> &recognized,
                                const fs::path &entrypoint, const command_override &override) {
    execution_plan plan;
    plan.language = *registry.find_by_extension(entrypoint);
    plan.entrypoint = entrypoint;
    for (auto &file : recognized)
        if (plan.language.matches(file)) plan.sources.push_back(file);
    plan.build = plan.language.build;
    plan.run = plan.language.run;

    // 以 sh -c 执行用户命令时，"$@" 保证测试参数仍然能够传给程序
    if (override.build) plan.build = {{"/bin/sh", "-c", *override.build}};
    if (override.run) plan.run = {"/bin/sh", "-c", *override.run + " \"$@\"", "sh"};
    plan.overridden = override.has_commands();
    return plan;
}

static vector<string> to_strings(const vector<fs::path> &paths) {
    vector<string> result;
    for (auto &path : paths) result.push_back(path.string());
    return result;
}

resolve_result resolve_entrypoint(const language_registry &registry, const fs::path &root,
                                  const vector<fs::path> &files, const command_override &override) {
    vector<fs::path> recognized;
    for (auto &file : files)
        if (registry.find_by_extension(file)) recognized.push_back(file);
    sort(recognized.begin(), recognized.end());

    if (recognized.empty())
        return entrypoint_failure{verdict_kind::DISCOVERY_FAILURE, "no recognized source files", {}};

    if (override.entrypoint) {
        auto it = find(recognized.begin(), recognized.end(), *override.entrypoint);
        if (it != recognized.end()) return make_plan(registry, recognized, *it, override);
        LOG(WARNING) << "Requested entrypoint " << *override.entrypoint << " is not a recognized source file of " << root;
    }

    vector<fs::path> pool;
    for (auto &file : recognized) {
        auto profile = registry.find_by_extension(file);
        if (profile->has_main(read_file_content(root / file, ""))) pool.push_back(file);
    }
    if (pool.empty()) pool = recognized;

    vector<fs::path> candidates = pool;
    for (string hint : NAME_HINTS) {
        vector<fs::path> matches;
        for (auto &file : pool)
            if (to_lower(file.stem().string()).find(hint) != string::npos) matches.push_back(file);

        if (matches.size() == 1) return make_plan(registry, recognized, matches[0], override);
        if (matches.size() > 1 && !hint.empty()) {
            candidates = matches;
            break;
        }
    }

    if (override.has_commands()) {
        LOG(INFO) << "Ambiguous entrypoint in " << root << ", using " << candidates[0] << " with user supplied commands";
        return make_plan(registry, recognized, candidates[0], override);
    }

    return entrypoint_failure{verdict_kind::AMBIGUOUS_ENTRYPOINT,
                              fmt::format("cannot decide between {} candidate entrypoints: {}", candidates.size(),
                                          fmt::join(to_strings(candidates), ", ")),
                              candidates};
}

}  // namespace grader
