#include "ojudge/common/exceptions.hpp"
#include <fmt/core.h>
#include <boost/exception/diagnostic_information.hpp>

namespace ojudge {
using namespace std;

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

problem_error::problem_error(const string &message)
    : judge_exception(message) {}

malformed_config::malformed_config(const string &message)
    : problem_error(message) {}

missing_test_data::missing_test_data(size_t index, artifact kind, const string &location)
    : problem_error(fmt::format("Missing {} file for test case {}: {}", artifact_name(kind), index, location)),
      test_index(index),
      missing(kind) {}

size_t missing_test_data::index() const noexcept {
    return test_index;
}

missing_test_data::artifact missing_test_data::kind() const noexcept {
    return missing;
}

const char *artifact_name(missing_test_data::artifact kind) {
    return kind == missing_test_data::artifact::INPUT ? "input" : "output";
}

}  // namespace ojudge
