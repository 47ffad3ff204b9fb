#include "common/io_utils.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace coderun {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.flush();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    fs::path p(subpath);
    if (subpath.empty() || p.is_absolute() || p.has_root_name() ||
        any_of(p.begin(), p.end(), [](const fs::path &part) { return part == ".."; }))
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

bool is_inside_directory(const fs::path &root, const fs::path &path) {
    error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) return false;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) return false;

    auto root_end = mismatch(canonical_root.begin(), canonical_root.end(), resolved.begin(), resolved.end()).first;
    return root_end == canonical_root.end();
}

}  // namespace coderun
