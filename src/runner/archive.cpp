#include "runner/archive.hpp"

namespace coderun {
using namespace std;

execution_outcome run_from_directory(executor &exec,
                                     const string &entry,
                                     const string &language,
                                     const filesystem::path &root_dir,
                                     const string &archive_name) {
    directory_entry unit;
    unit.language = language;
    unit.entry = entry;
    unit.root_dir = root_dir;
    unit.archive_name = archive_name;
    return exec.run(unit);
}

}  // namespace coderun
