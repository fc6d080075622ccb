#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace ladder {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(status status) {
    return status_string.at(status);
}

ostream &operator<<(ostream &os, status status) {
    return os << get_display_message(status);
}

}  // namespace ladder
