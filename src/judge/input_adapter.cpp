#include "codejudge/judge/input_adapter.hpp"
#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include <set>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

using ordered_json = nlohmann::ordered_json;

static char first_non_blank(const string &text) {
    for (char c : text)
        if (!isspace((unsigned char)c)) return c;
    return '\0';
}

static string render_scalar(const parameter &param, semantic_type type, const ordered_json &value) {
    switch (type) {
        case semantic_type::INT:
            if (!value.is_number_integer()) break;
            return value.dump();
        case semantic_type::FLOAT:
            if (!value.is_number()) break;
            // dump 输出能够精确还原的最短表示
            return value.dump();
        case semantic_type::STRING: {
            if (!value.is_string()) break;
            auto str = value.get<string>();
            if (str.find_first_of("\r\n") != string::npos)
                throw malformed_input_error(fmt::format("Value of parameter '{}' contains a line break", param.name));
            return str;
        }
        case semantic_type::BOOL:
            if (!value.is_boolean()) break;
            return value.get<bool>() ? "true" : "false";
        default:
            break;
    }
    throw malformed_input_error(fmt::format("Value {} of parameter '{}' is not of type {}", value.dump(), param.name, get_type_name(type)));
}

static string render_value(const parameter &param, const ordered_json &value) {
    if (!is_list_type(param.type))
        return render_scalar(param, param.type, value);

    if (!value.is_array())
        throw malformed_input_error(fmt::format("Value {} of parameter '{}' is not a list", value.dump(), param.name));
    semantic_type elem = element_type(param.type);
    vector<string> tokens;
    for (auto &item : value) {
        string token = render_scalar(param, elem, item);
        // 列表在一行中以空白字符分隔，元素本身不能为空或者包含空白字符
        if (elem == semantic_type::STRING &&
            (token.empty() || token.find_first_of(" \t\v\f") != string::npos))
            throw malformed_input_error(fmt::format("List element {} of parameter '{}' is empty or contains whitespace", item.dump(), param.name));
        tokens.push_back(move(token));
    }
    return boost::algorithm::join(tokens, " ");
}

static string render_untyped(const ordered_json &value) {
    if (value.is_string()) return value.get<string>();
    if (value.is_array()) {
        vector<string> tokens;
        for (auto &item : value) tokens.push_back(render_untyped(item));
        return boost::algorithm::join(tokens, " ");
    }
    return value.dump();
}

static ordered_json parse(const string &input_data) {
    try {
        return ordered_json::parse(input_data);
    } catch (nlohmann::json::parse_error &e) {
        throw malformed_input_error(fmt::format("Test input is not valid JSON: {}", e.what()));
    }
}

string to_stdin(const vector<parameter> &parameters, const string &input_data) {
    char first = first_non_blank(input_data);
    bool single_list = parameters.size() == 1 && is_list_type(parameters[0].type);

    if (first == '[' && single_list)
        return render_value(parameters[0], parse(input_data)) + "\n";
    if (parameters.empty() && first != '{') {
        // 没有函数声明时，整体能解析为 JSON 的数组或者标量也展开为一行
        ordered_json data = ordered_json::parse(input_data, nullptr, false);
        if (data.is_discarded() || data.is_null())
            return input_data;
        return render_untyped(data) + "\n";
    }
    if (first != '{')
        return input_data;

    ordered_json data = parse(input_data);
    if (!data.is_object())
        throw malformed_input_error("Test input should be a JSON object: " + input_data);

    string result;
    if (parameters.empty()) {
        for (auto it = data.begin(); it != data.end(); ++it)
            result += render_untyped(it.value()) + "\n";
        return result;
    }

    set<string> names;
    for (auto &param : parameters) names.insert(param.name);
    if (data.size() != parameters.size())
        throw malformed_input_error(fmt::format("Test input has {} values but the function takes {} parameters", data.size(), parameters.size()));
    for (auto it = data.begin(); it != data.end(); ++it)
        if (!names.count(it.key()))
            throw malformed_input_error(fmt::format("Test input has unknown parameter '{}'", it.key()));

    for (auto &param : parameters)
        result += render_value(param, data.at(param.name)) + "\n";
    return result;
}

}  // namespace codejudge
