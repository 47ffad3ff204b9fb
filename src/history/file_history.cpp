#include "history/file_history.hpp"
#include <glog/logging.h>
#include <fstream>
#include <system_error>

namespace coderun {
using namespace std;
using namespace nlohmann;

file_history::file_history(const filesystem::path &path)
    : path(path) {}

void file_history::append(const history_record &record) {
    // 捕获的输出可能不是合法的 UTF-8，这里替换非法字符而不是抛出异常
    string line = json(record).dump(-1, ' ', false, json::error_handler_t::replace);

    scoped_lock guard(mut);
    ofstream fout(path, ios::app);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open history file " + path.string());
    fout << line << '\n';
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write history file " + path.string());
}

vector<history_record> file_history::read_all() const {
    scoped_lock guard(mut);
    vector<history_record> records;
    ifstream fin(path);
    string line;
    size_t lineno = 0;
    while (getline(fin, line)) {
        ++lineno;
        if (line.empty()) continue;
        try {
            records.push_back(json::parse(line).get<history_record>());
        } catch (std::exception &e) {
            LOG(WARNING) << "Skipping malformed history line " << lineno << " of " << path << ": " << e.what();
        }
    }
    return records;
}

}  // namespace coderun
