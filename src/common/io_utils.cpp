#include "common/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin) throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout << content;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == ".." || (!subpath.empty() && subpath[0] == '/'))
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

bool is_ignored_entry(const fs::path &path) {
    string name = path.filename().string();
    return name.empty() || name[0] == '.' || name == "__MACOSX";
}

static void collect_files(const fs::path &root, const fs::path &dir, vector<fs::path> &files) {
    for (auto &entry : fs::directory_iterator(dir)) {
        if (is_ignored_entry(entry.path())) continue;
        if (entry.is_directory())
            collect_files(root, entry.path(), files);
        else if (entry.is_regular_file())
            files.push_back(fs::relative(entry.path(), root));
    }
}

vector<fs::path> list_files_recursive(const fs::path &dir) {
    vector<fs::path> files;
    if (!fs::is_directory(dir)) return files;
    collect_files(dir, dir, files);
    sort(files.begin(), files.end());
    return files;
}

void copy_directory(const fs::path &from, const fs::path &to) {
    fs::create_directories(to);
    for (auto &file : list_files_recursive(from)) {
        fs::path target = to / assert_safe_path(file.generic_string());
        fs::create_directories(target.parent_path());
        fs::copy_file(from / file, target, fs::copy_options::overwrite_existing);
    }
}

}  // namespace grader
