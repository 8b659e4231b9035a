#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
using namespace std;

extern char **environ;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

optional<filesystem::path> find_executable(const string &name, const string &search_path) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (access(name.c_str(), X_OK) == 0 && !filesystem::is_directory(name))
            return filesystem::path(name);
        return nullopt;
    }

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        // POSIX 规定 PATH 中的空项表示当前目录
        filesystem::path candidate = filesystem::path(dir.empty() ? "." : dir) / name;
        error_code ec;
        if (access(candidate.c_str(), X_OK) == 0 && !filesystem::is_directory(candidate, ec))
            return candidate;
    }
    return nullopt;
}

vector<string> build_environment(const map<string, string> &overrides) {
    vector<string> result;
    for (char **env = environ; env && *env; ++env) {
        string entry(*env);
        string key = entry.substr(0, entry.find('='));
        if (!overrides.count(key)) result.push_back(move(entry));
    }
    for (auto &[key, value] : overrides)
        result.push_back(key + "=" + value);
    return result;
}
