#include "ojudge/common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace ojudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::JUDGE_ERROR, "Judge Error");

static const unordered_map<execution_status, const char *> execution_status_string = boost::assign::map_list_of
    (execution_status::EXECUTED, "Executed")
    (execution_status::RUNTIME_ERROR, "Runtime Error")
    (execution_status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (execution_status::JUDGE_ERROR, "Judge Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(execution_status stat) {
    return execution_status_string.at(stat);
}

status to_status(execution_status stat) {
    switch (stat) {
        case execution_status::RUNTIME_ERROR:
            return status::RUNTIME_ERROR;
        case execution_status::TIME_LIMIT_EXCEEDED:
            return status::TIME_LIMIT_EXCEEDED;
        case execution_status::JUDGE_ERROR:
            return status::JUDGE_ERROR;
        default:
            throw invalid_argument("executed program has no final verdict");
    }
}

status parse_status(const string &text) {
    for (auto &[stat, name] : status_string)
        if (text == name) return stat;
    throw invalid_argument("unrecognized verdict " + text);
}

}  // namespace ojudge
