#include "runner/source_unit.hpp"

namespace coderun {
using namespace std;

const string &language_of(const source_unit &unit) {
    return visit([](auto &u) -> const string & { return u.language; }, unit);
}

}  // namespace coderun
