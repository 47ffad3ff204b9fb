#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace coderun {
using namespace std;

coderun_exception::coderun_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *coderun_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const coderun_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error(const string &message)
    : coderun_exception(message) {}

provider_error::provider_error(const string &message)
    : coderun_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : coderun_exception("Unsupported language: " + language), language(language) {}

entry_not_found::entry_not_found(const string &entry)
    : coderun_exception("Entry file not found: " + entry), entry(entry) {}

}  // namespace coderun
