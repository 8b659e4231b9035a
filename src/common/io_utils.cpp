#include "common/io_utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utime.h>
#include <chrono>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace quest {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
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
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout << content;
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  //U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

size_t utf8_truncate(string &string, size_t limit) {
    if (string.size() <= limit) return string.size();
    size_t end = limit;
    // 回退到一个非 10bbbbbb 的字节，即字符的起始位置
    while (end > 0 && ((unsigned char)string[end] & 0xC0) == 0x80)
        --end;
    // 若回退超过 3 字节则说明原文本不是合法的 UTF-8，直接按字节截断
    if (limit - end > 3) end = limit;
    string.resize(end);
    return end;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty())
        throw invalid_request("empty file name");
    fs::path path(subpath);
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory())
        throw invalid_request("subpath is not safe " + subpath);
    for (auto &part : path)
        if (part == "..")
            throw invalid_request("subpath is not safe " + subpath);
    return subpath;
}

time_t last_write_time(const fs::path &path) {
    struct stat attr;
    if (stat(path.c_str(), &attr) != 0)
        throw system_error(errno, system_category(), "error when reading modification time of path " + path.string());
    return attr.st_mtim.tv_sec;
}

void last_write_time(const fs::path &path, time_t timestamp) {
    struct utimbuf buf;
    buf.actime = chrono::system_clock::to_time_t(chrono::system_clock::now());
    buf.modtime = timestamp;
    if (utime(path.c_str(), &buf) == -1)
        throw system_error(errno, system_category(), "error when setting modification time of path " + path.string());
}

}  // namespace quest
