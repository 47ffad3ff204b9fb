#include "history/memory_history.hpp"

namespace coderun {
using namespace std;

memory_history::memory_history(size_t capacity)
    : capacity(capacity) {}

void memory_history::append(const history_record &record) {
    scoped_lock guard(mut);
    records.push_front(record);
    while (records.size() > capacity)
        records.pop_back();
}

vector<history_record> memory_history::snapshot() const {
    scoped_lock guard(mut);
    return vector<history_record>(records.begin(), records.end());
}

}  // namespace coderun
