#include "codejudge/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PENDING, "Pending")
    (status::RUNNING, "Running")
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::SYSTEM_ERROR, "System Error")
    (status::CANCELLED, "Cancelled")
    (status::NOT_ATTEMPTED, "Not Attempted");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

int severity(status stat) {
    switch (stat) {
        case status::COMPILATION_ERROR: return 4;
        case status::RUNTIME_ERROR: return 3;
        case status::TIME_LIMIT_EXCEEDED: return 2;
        case status::WRONG_ANSWER: return 1;
        default: return 0;
    }
}

bool is_verdict(status stat) {
    switch (stat) {
        case status::ACCEPTED:
        case status::WRONG_ANSWER:
        case status::TIME_LIMIT_EXCEEDED:
        case status::RUNTIME_ERROR:
        case status::COMPILATION_ERROR:
            return true;
        default:
            return false;
    }
}

}  // namespace codejudge
