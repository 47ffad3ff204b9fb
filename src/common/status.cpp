#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace coderun {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIMED_OUT, "Timed Out")
    (status::RESOURCE_KILLED, "Resource Killed")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::ENTRY_NOT_FOUND, "Entry Not Found")
    (status::INTERNAL_FAILURE, "Internal Failure");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

ostream &operator<<(ostream &os, status stat) {
    return os << get_display_message(stat);
}

}  // namespace coderun
