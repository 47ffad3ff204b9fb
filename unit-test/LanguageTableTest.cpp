#include <algorithm>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "runner/language.hpp"

using namespace std;
using namespace coderun;

static language make_language(const string &name, const string &entry) {
    language lang;
    lang.name = name;
    lang.image = name + ":latest";
    lang.interpreter = {name};
    lang.entry_filename = entry;
    return lang;
}

TEST(LanguageTableTest, DefaultsSupportPythonAndNode) {
    language_table table = language_table::defaults();
    EXPECT_EQ(table.size(), 2u);

    const language &python = table.at("python");
    EXPECT_EQ(python.image, "python:3.11-slim");
    EXPECT_EQ(python.entry_filename, "user_code.py");
    EXPECT_EQ(python.oom_marker, "MemoryError");

    const language &node = table.at("node");
    EXPECT_EQ(node.image, "node:20-slim");
    EXPECT_EQ(node.entry_filename, "user_code.js");
    EXPECT_EQ(node.oom_marker, "JavaScript heap out of memory");
}

TEST(LanguageTableTest, LookupIgnoresCase) {
    language_table table = language_table::defaults();
    ASSERT_NE(table.find("Python"), nullptr);
    EXPECT_EQ(table.find("PYTHON")->name, "python");
}

TEST(LanguageTableTest, UnknownLanguageThrows) {
    language_table table = language_table::defaults();
    EXPECT_EQ(table.find("cobol"), nullptr);
    try {
        table.at("cobol");
        FAIL() << "unsupported_language expected";
    } catch (unsupported_language &ex) {
        EXPECT_EQ(ex.language, "cobol");
        EXPECT_STREQ(ex.what(), "Unsupported language: cobol");
    }
}

TEST(LanguageTableTest, RejectsDuplicatedLanguage) {
    EXPECT_THROW(language_table({make_language("ruby", "main.rb"), make_language("Ruby", "main.rb")}), invalid_argument);
}

TEST(LanguageTableTest, RejectsUnsafeEntryFilename) {
    EXPECT_THROW(language_table({make_language("ruby", "../main.rb")}), invalid_argument);
    EXPECT_THROW(language_table({make_language("ruby", "/main.rb")}), invalid_argument);
}

TEST(LanguageTableTest, RejectsIncompleteLanguage) {
    language lang = make_language("ruby", "main.rb");
    lang.interpreter.clear();
    EXPECT_THROW(language_table({lang}), invalid_argument);
}

TEST(LanguageTableTest, LoadFromJson) {
    nlohmann::json j = R"({
        "languages": [
            { "name": "ruby", "image": "ruby:3.3-slim", "interpreter": ["ruby", "-W0"], "entry": "main.rb", "scratch": "/tmp" },
            { "name": "python", "image": "python:3.12-slim", "interpreter": ["python", "-u"], "entry": "main.py", "oom_marker": "MemoryError" }
        ]
    })"_json;
    language_table table = language_table::from_json(j);
    EXPECT_EQ(table.size(), 2u);

    const language &ruby = table.at("ruby");
    EXPECT_EQ(ruby.interpreter, vector<string>({"ruby", "-W0"}));
    EXPECT_EQ(ruby.scratch_dir, "/tmp");
    EXPECT_TRUE(ruby.oom_marker.empty());

    EXPECT_EQ(table.at("python").oom_marker, "MemoryError");

    vector<string> names = table.names();
    sort(names.begin(), names.end());
    EXPECT_EQ(names, vector<string>({"python", "ruby"}));
}

TEST(LanguageTableTest, LoadFromJsonMissingKey) {
    nlohmann::json j = R"({ "languages": [ { "name": "ruby", "interpreter": ["ruby"], "entry": "main.rb" } ] })"_json;
    EXPECT_THROW(language_table::from_json(j), invalid_argument);
    EXPECT_THROW(language_table::from_json(nlohmann::json::object()), invalid_argument);
}

TEST(LanguageTableTest, LoadMissingFile) {
    EXPECT_THROW(language_table::load("/nonexistent/languages.json"), invalid_argument);
}
