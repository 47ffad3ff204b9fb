#include "runner/language.hpp"
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

language_table::language_table(const vector<language> &list) {
    for (auto &lang : list) {
        if (lang.name.empty())
            throw invalid_argument("language name should not be empty");
        if (lang.image.empty() || lang.interpreter.empty() || lang.entry_filename.empty())
            throw invalid_argument("language " + lang.name + " should specify image, interpreter and entry");
        assert_safe_path(lang.entry_filename);

        string key = boost::algorithm::to_lower_copy(lang.name);
        if (!languages.emplace(key, lang).second)
            throw invalid_argument("duplicated language " + lang.name);
    }
}

const language *language_table::find(const string &name) const {
    auto it = languages.find(boost::algorithm::to_lower_copy(name));
    return it == languages.end() ? nullptr : &it->second;
}

const language &language_table::at(const string &name) const {
    const language *lang = find(name);
    if (!lang) throw unsupported_language(name);
    return *lang;
}

vector<string> language_table::names() const {
    vector<string> result;
    for (auto &[key, lang] : languages) result.push_back(lang.name);
    return result;
}

size_t language_table::size() const {
    return languages.size();
}

language_table language_table::defaults() {
    language python;
    python.name = "python";
    python.image = "python:3.11-slim";
    python.interpreter = {"python"};
    python.entry_filename = "user_code.py";
    python.oom_marker = "MemoryError";

    language node;
    node.name = "node";
    node.image = "node:20-slim";
    node.interpreter = {"node"};
    node.entry_filename = "user_code.js";
    node.oom_marker = "JavaScript heap out of memory";

    return language_table({python, node});
}

language_table language_table::from_json(const json &j) {
    const json &items = access(j, "languages");
    if (!items.is_array())
        throw build_invalid_argument(j, "languages");
    vector<language> list;
    for (auto &item : items) {
        language lang;
        lang.name = get_value<string>(item, "name");
        lang.image = get_value<string>(item, "image");
        lang.interpreter = get_value<vector<string>>(item, "interpreter");
        lang.entry_filename = get_value<string>(item, "entry");
        lang.oom_marker = get_value_def<string>(item, "", "oom_marker");
        lang.scratch_dir = get_value_def<string>(item, "", "scratch");
        list.push_back(move(lang));
    }
    return language_table(list);
}

language_table language_table::load(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw invalid_argument("language table " + path.string() + " does not exist");
    json j;
    try {
        j = json::parse(read_file_content(path));
    } catch (json::parse_error &e) {
        throw invalid_argument("language table " + path.string() + " is malformed: " + e.what());
    }
    return from_json(j);
}

}  // namespace coderun
