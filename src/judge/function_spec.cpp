#include "codejudge/judge/function_spec.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/assign.hpp>
#include <fmt/core.h>
#include <map>
#include <regex>
#include <set>
#include <unordered_map>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/json_utils.hpp"

namespace codejudge {
using namespace std;

// clang-format off
static const map<string, semantic_type> type_names = boost::assign::map_list_of
    ("int", semantic_type::INT)
    ("integer", semantic_type::INT)
    ("long", semantic_type::INT)
    ("float", semantic_type::FLOAT)
    ("double", semantic_type::FLOAT)
    ("string", semantic_type::STRING)
    ("str", semantic_type::STRING)
    ("bool", semantic_type::BOOL)
    ("boolean", semantic_type::BOOL)
    ("list-of-int", semantic_type::LIST_INT)
    ("list", semantic_type::LIST_INT)
    ("array", semantic_type::LIST_INT)
    ("list[int]", semantic_type::LIST_INT)
    ("list<int>", semantic_type::LIST_INT)
    ("int[]", semantic_type::LIST_INT)
    ("list-of-float", semantic_type::LIST_FLOAT)
    ("list[float]", semantic_type::LIST_FLOAT)
    ("list<float>", semantic_type::LIST_FLOAT)
    ("list[double]", semantic_type::LIST_FLOAT)
    ("double[]", semantic_type::LIST_FLOAT)
    ("list-of-string", semantic_type::LIST_STRING)
    ("list[str]", semantic_type::LIST_STRING)
    ("list[string]", semantic_type::LIST_STRING)
    ("list<string>", semantic_type::LIST_STRING)
    ("string[]", semantic_type::LIST_STRING)
    ("list-of-bool", semantic_type::LIST_BOOL)
    ("list[bool]", semantic_type::LIST_BOOL)
    ("list<bool>", semantic_type::LIST_BOOL)
    ("bool[]", semantic_type::LIST_BOOL);

static const unordered_map<semantic_type, const char *> canonical_names = boost::assign::map_list_of
    (semantic_type::INT, "int")
    (semantic_type::FLOAT, "float")
    (semantic_type::STRING, "string")
    (semantic_type::BOOL, "bool")
    (semantic_type::LIST_INT, "list-of-int")
    (semantic_type::LIST_FLOAT, "list-of-float")
    (semantic_type::LIST_STRING, "list-of-string")
    (semantic_type::LIST_BOOL, "list-of-bool");
// clang-format on

// 各语言模板中 main 函数使用的局部变量
static const set<string> reserved_names = {
    "result", "reader", "output", "lines", "args", "main", "i", "value", "in", "token", "returnSize"};

semantic_type parse_semantic_type(const string &name) {
    string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    auto it = type_names.find(key);
    if (it == type_names.end())
        throw unsupported_type_error("Unsupported type: " + name);
    return it->second;
}

const char *get_type_name(semantic_type type) {
    return canonical_names.at(type);
}

bool is_list_type(semantic_type type) {
    switch (type) {
        case semantic_type::LIST_INT:
        case semantic_type::LIST_FLOAT:
        case semantic_type::LIST_STRING:
        case semantic_type::LIST_BOOL:
            return true;
        default:
            return false;
    }
}

semantic_type element_type(semantic_type type) {
    switch (type) {
        case semantic_type::LIST_INT: return semantic_type::INT;
        case semantic_type::LIST_FLOAT: return semantic_type::FLOAT;
        case semantic_type::LIST_STRING: return semantic_type::STRING;
        case semantic_type::LIST_BOOL: return semantic_type::BOOL;
        default: return type;
    }
}

static void validate_identifier(const string &name, const string &what) {
    static const regex identifier("^[A-Za-z_][A-Za-z0-9_]*$");
    if (!regex_match(name, identifier))
        throw malformed_input_error(fmt::format("{} '{}' is not a valid identifier", what, name));
    if (reserved_names.count(name))
        throw malformed_input_error(fmt::format("{} '{}' is reserved by the code template", what, name));
}

void validate(const function_spec &spec) {
    validate_identifier(spec.name, "Function name");
    set<string> names;
    for (auto &param : spec.parameters) {
        validate_identifier(param.name, "Parameter name");
        if (param.name == spec.name)
            throw malformed_input_error("Parameter name '" + param.name + "' shadows the function name");
        if (!names.insert(param.name).second)
            throw malformed_input_error("Duplicate parameter name '" + param.name + "'");
    }
}

function_spec parse_function_spec(const nlohmann::ordered_json &j) {
    if (!j.is_object())
        throw malformed_input_error("Function spec should be an object: " + j.dump());

    function_spec spec;
    spec.name = get_value_def<string>(j, "solution", "name");

    if (exists(j, "parameters")) {
        auto &params = access(j, "parameters");
        if (params.is_array()) {
            for (auto &param : params) {
                spec.parameters.push_back({get_value<string>(param, "name"),
                                           parse_semantic_type(get_value<string>(param, "type"))});
            }
        } else if (params.is_object()) {
            for (auto it = params.begin(); it != params.end(); ++it) {
                if (!it.value().is_string())
                    throw build_malformed_input(j, "parameters", it.key());
                spec.parameters.push_back({it.key(), parse_semantic_type(it.value().get<string>())});
            }
        } else {
            throw build_malformed_input(j, "parameters");
        }
    }

    if (exists(j, "return_type"))
        spec.return_type = parse_semantic_type(get_value<string>(j, "return_type"));
    else if (exists(j, "returnType"))
        spec.return_type = parse_semantic_type(get_value<string>(j, "returnType"));
    else
        throw malformed_input_error("Function spec has no return type: " + j.dump());

    validate(spec);
    return spec;
}

nlohmann::ordered_json to_json(const function_spec &spec) {
    nlohmann::ordered_json params = nlohmann::ordered_json::array();
    for (auto &param : spec.parameters)
        params.push_back({{"name", param.name}, {"type", get_type_name(param.type)}});
    return {
        {"name", spec.name},
        {"parameters", params},
        {"return_type", get_type_name(spec.return_type)}};
}

}  // namespace codejudge
