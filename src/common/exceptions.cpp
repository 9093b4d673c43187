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
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

network_error::network_error()
    : grader_exception() {}

network_error::network_error(const string &message)
    : grader_exception(message) {}

store_error::store_error()
    : grader_exception() {}

store_error::store_error(const string &message)
    : grader_exception(message) {}

corrupted_object_error::corrupted_object_error(const string &digest, const string &actual)
    : store_error("object " + digest + " is corrupted, content digest is " + actual), digest(digest) {}

}  // namespace grader
