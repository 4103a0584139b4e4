#include "language/language.hpp"
#include <glog/logging.h>
#include <fmt/format.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

bool language_profile::matches(const filesystem::path &file) const {
    string ext = to_lower(file.extension().string());
    return find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

bool language_profile::has_main(const string &content) const {
    if (main_pattern.empty()) return true;
    return regex_search(content, main_regex);
}

void from_json(const json &j, language_profile &profile) {
    j.at("id").get_to(profile.id);
    j.at("extensions").get_to(profile.extensions);
    if (j.count("image"))
        j.at("image").get_to(profile.image);
    else
        profile.image = "";
    if (j.count("main_pattern"))
        j.at("main_pattern").get_to(profile.main_pattern);
    else
        profile.main_pattern = "";
    if (j.count("build"))
        j.at("build").get_to(profile.build);
    else
        profile.build.clear();
    j.at("run").get_to(profile.run);
}

language_registry::language_registry(vector<language_profile> profiles) : list(move(profiles)) {
    for (auto &profile : list) {
        for (auto &ext : profile.extensions) ext = to_lower(ext);
        if (profile.run.empty())
            throw configuration_error(fmt::format("language {} has no run command", profile.id));
        if (!profile.main_pattern.empty()) {
            try {
                profile.main_regex = regex(profile.main_pattern);
            } catch (regex_error &e) {
                throw configuration_error(fmt::format("language {} has an invalid main pattern: {}", profile.id, e.what()));
            }
        }
    }
}

// clang-format off
static vector<language_profile> builtin_profiles() {
    vector<language_profile> profiles(4);

    profiles[0].id = "python";
    profiles[0].extensions = {".py"};
    profiles[0].image = "python:3.13";
    profiles[0].main_pattern = R"(if\s+__name__\s*==\s*['"]__main__['"])";
    profiles[0].run = {"python3", "{code}/{entrypoint}"};

    profiles[1].id = "java";
    profiles[1].extensions = {".java"};
    profiles[1].image = "maven:latest";
    profiles[1].main_pattern = R"(static\s+void\s+main\s*\()";
    profiles[1].build = {{"javac", "-encoding", "UTF-8", "-d", "{compiled}", "{sources}"}};
    profiles[1].run = {"java", "-cp", "{compiled}", "{entrypoint_stem}"};

    profiles[2].id = "c";
    profiles[2].extensions = {".c"};
    profiles[2].image = "gcc:latest";
    profiles[2].main_pattern = R"(\b(int|void)\s+main\s*\()";
    profiles[2].build = {{"gcc", "-O2", "-o", "{compiled}/main", "{sources}", "-lm"}};
    profiles[2].run = {"{compiled}/main"};

    profiles[3].id = "cpp";
    profiles[3].extensions = {".cpp", ".cc", ".cxx"};
    profiles[3].image = "gcc:latest";
    profiles[3].main_pattern = R"(\b(int|void)\s+main\s*\()";
    profiles[3].build = {{"g++", "-O2", "-o", "{compiled}/main", "{sources}"}};
    profiles[3].run = {"{compiled}/main"};

    return profiles;
}
// clang-format on

const language_registry &language_registry::builtin() {
    static const language_registry registry(builtin_profiles());
    return registry;
}

const language_profile *language_registry::find_by_extension(const filesystem::path &file) const {
    for (auto &profile : list)
        if (profile.matches(file)) return &profile;
    return nullptr;
}

const language_profile *language_registry::find_by_id(const string &id) const {
    for (auto &profile : list)
        if (profile.id == id) return &profile;
    return nullptr;
}

const vector<language_profile> &language_registry::profiles() const {
    return list;
}

language_registry load_language_registry(const filesystem::path &file) {
    vector<language_profile> profiles;
    try {
        json j = json::parse(read_file_content(file));
        j.get_to(profiles);
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("malformed language file {}: {}", file.string(), e.what()));
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to read language file {}: {}", file.string(), e.what()));
    }
    if (profiles.empty())
        throw configuration_error(fmt::format("language file {} declares no language", file.string()));
    LOG(INFO) << "Loaded " << profiles.size() << " languages from " << file;
    return language_registry(move(profiles));
}

vector<string> expand_command(const vector<string> &command, const map<string, string> &vars, const vector<string> &sources) {
    vector<string> result;
    for (auto &arg : command) {
        if (arg == "{sources}") {
            append(result, sources);
            continue;
        }
        string expanded = arg;
        for (auto &[key, value] : vars)
            expanded = replace_all(expanded, "{" + key + "}", value);
        result.push_back(move(expanded));
    }
    return result;
}

}  // namespace grader
