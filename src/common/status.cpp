#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace quest {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::COMPILE_ERROR, "Compile Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIMEOUT, "Timeout")
    (status::RESOURCE_EXCEEDED, "Resource Exceeded")
    (status::INTERNAL_ERROR, "Internal Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::COMPILE_ERROR, "compile_error")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::TIMEOUT, "timeout")
    (status::RESOURCE_EXCEEDED, "resource_exceeded")
    (status::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, value] : status_name)
        if (name == value) return stat;
    throw invalid_argument("unknown status " + name);
}

}  // namespace quest
