#include "engine/command.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace quest::engine {
using namespace std;

// clang-format off
static const unordered_map<step_role, const char *> step_name = boost::assign::map_list_of
    (step_role::SETUP, "setup")
    (step_role::COMPILE, "compile")
    (step_role::BUILD, "build")
    (step_role::RUN, "run")
    (step_role::TEARDOWN, "teardown");

static const unordered_map<termination, const char *> termination_name = boost::assign::map_list_of
    (termination::EXITED, "exited")
    (termination::SIGNALED, "signaled")
    (termination::TIMEOUT, "timeout")
    (termination::RESOURCE_EXCEEDED, "resource_exceeded")
    (termination::CANCELLED, "cancelled")
    (termination::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_step_name(step_role role) {
    return step_name.at(role);
}

const char *get_termination_name(termination term) {
    return termination_name.at(term);
}

bool raw_outcome::succeeded() const {
    return term == termination::EXITED && exit_code == 0;
}

}  // namespace quest::engine
