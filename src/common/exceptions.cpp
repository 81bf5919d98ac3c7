#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

not_found_error::not_found_error()
    : grader_exception() {}

not_found_error::not_found_error(const string &message)
    : grader_exception(message) {}

validation_error::validation_error()
    : grader_exception() {}

validation_error::validation_error(const string &message)
    : grader_exception(message) {}

infrastructure_error::infrastructure_error()
    : grader_exception() {}

infrastructure_error::infrastructure_error(const string &message)
    : grader_exception(message) {}

network_error::network_error()
    : infrastructure_error() {}

network_error::network_error(const string &message)
    : infrastructure_error(message) {}

database_error::database_error()
    : infrastructure_error() {}

database_error::database_error(const string &message)
    : infrastructure_error(message) {}

invariant_violation::invariant_violation()
    : grader_exception() {}

invariant_violation::invariant_violation(const string &message)
    : grader_exception(message) {}

}  // namespace grader
