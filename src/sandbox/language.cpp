#include "codejudge/sandbox/language.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <glog/logging.h>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/json_utils.hpp"

namespace codejudge {
using namespace std;

language_config parse_language_config(const nlohmann::json &j) {
    language_config config;
    config.name = get_value<string>(j, "name");
    config.source_file = get_value<string>(j, "source_file");
    config.compile_command = get_value_def<vector<string>>(j, {}, "compile_command");
    config.run_command = get_value<vector<string>>(j, "run_command");
    config.compile_time_limit = get_value_def<double>(j, 0, "compile_time_limit");
    config.class_pattern = get_value_def<string>(j, "", "class_pattern");
    if (config.run_command.empty())
        throw build_malformed_input(j, "run_command");
    return config;
}

nlohmann::json to_json(const language_config &config) {
    nlohmann::json j = {
        {"name", config.name},
        {"source_file", config.source_file},
        {"compile_command", config.compile_command},
        {"run_command", config.run_command},
        {"compile_time_limit", config.compile_time_limit}};
    if (!config.class_pattern.empty())
        j["class_pattern"] = config.class_pattern;
    return j;
}

vector<string> expand_command(const vector<string> &command, const map<string, string> &variables) {
    vector<string> result;
    for (string arg : command) {
        for (auto &[key, value] : variables)
            boost::algorithm::replace_all(arg, "{" + key + "}", value);
        result.push_back(move(arg));
    }
    return result;
}

void language_registry::add(language_config config) {
    string name = config.name;
    languages[name] = move(config);
}

const language_config &language_registry::at(const string &name) const {
    auto it = languages.find(name);
    if (it == languages.end())
        throw unsupported_language_error("Unsupported language: " + name);
    return it->second;
}

bool language_registry::contains(const string &name) const {
    return languages.count(name);
}

vector<string> language_registry::names() const {
    vector<string> result;
    for (auto &[name, config] : languages) result.push_back(name);
    return result;
}

void language_registry::load(const nlohmann::json &j) {
    if (!j.is_array())
        throw malformed_input_error("Language configuration should be an array: " + j.dump());
    for (auto &item : j) {
        language_config config = parse_language_config(item);
        LOG(INFO) << "Loaded language " << config.name;
        add(move(config));
    }
}

language_registry language_registry::default_languages() {
    language_registry registry;

    language_config python;
    python.name = "python";
    python.source_file = "main.py";
    python.compile_command = {"python3", "-m", "py_compile", "{source}"};
    python.run_command = {"python3", "{compile_dir}/{source}"};
    registry.add(python);

    language_config javascript;
    javascript.name = "javascript";
    javascript.source_file = "main.js";
    javascript.compile_command = {"node", "--check", "{source}"};
    javascript.run_command = {"node", "{compile_dir}/{source}"};
    registry.add(javascript);

    language_config cpp;
    cpp.name = "cpp";
    cpp.source_file = "main.cpp";
    cpp.compile_command = {"g++", "-O2", "-std=c++17", "-o", "program", "{source}"};
    cpp.run_command = {"{compile_dir}/program"};
    registry.add(cpp);

    language_config c;
    c.name = "c";
    c.source_file = "main.c";
    c.compile_command = {"gcc", "-O2", "-o", "program", "{source}", "-lm"};
    c.run_command = {"{compile_dir}/program"};
    registry.add(c);

    // 类名必须与文件名一致，因此从代码中找到 public class 的名字
    language_config java;
    java.name = "java";
    java.source_file = "{class}.java";
    java.compile_command = {"javac", "-encoding", "UTF-8", "{source}"};
    java.run_command = {"java", "-cp", "{compile_dir}", "{class}"};
    java.class_pattern = "public\\s+(?:final\\s+)?class\\s+(\\w+)";
    registry.add(java);

    return registry;
}

}  // namespace codejudge
