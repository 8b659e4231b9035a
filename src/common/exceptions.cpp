#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace quest {
using namespace std;

quest_exception::quest_exception()
    : quest_exception("") {}

quest_exception::quest_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *quest_exception::what() const noexcept {
    return message.c_str();
}

const boost::stacktrace::stacktrace &quest_exception::trace() const {
    return *stacktrace;
}

std::ostream &operator<<(std::ostream &os, const quest_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : quest_exception() {}

internal_error::internal_error(const string &message)
    : quest_exception(message) {}

unsupported_configuration::unsupported_configuration(const string &message)
    : quest_exception(message) {}

invalid_request::invalid_request(const string &message)
    : quest_exception(message) {}

admission_rejected::admission_rejected(const string &message)
    : quest_exception(message) {}

}  // namespace quest
