#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "codejudge/template/generator.hpp"

namespace codejudge {
using namespace std;

namespace {

const char *CPP_LIST_WRITE = R"(    cout << "[";
    for (size_t i = 0; i < result.size(); ++i) {{
        if (i > 0) cout << ",";
        cout << {};
    }}
    cout << "]" << endl;
)";

string cpp_list_read(const string &element_type, const string &push) {
    return fmt::format(R"(    string ${{name}}_line;
    getline(cin, ${{name}}_line);
    vector<{0}> ${{name}};
    {{
        istringstream in(${{name}}_line);
        {1} value;
        while (in >> value) ${{name}}.push_back({2});
    }}
)",
                       element_type, element_type == "bool" ? "string" : element_type, push);
}

struct cpp_template : public language_template {
    string language() const override {
        return "cpp";
    }

    const set<string> &reserved_words() const override {
        static const set<string> words = {
            "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break",
            "case", "catch", "char", "char16_t", "char32_t", "class", "compl", "const", "const_cast",
            "constexpr", "continue", "decltype", "default", "delete", "do", "double", "dynamic_cast",
            "else", "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
            "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq",
            "nullptr", "operator", "or", "or_eq", "private", "protected", "public", "register",
            "reinterpret_cast", "return", "short", "signed", "sizeof", "static", "static_assert",
            "static_cast", "struct", "switch", "template", "this", "thread_local", "throw", "true",
            "try", "typedef", "typeid", "typename", "union", "unsigned", "using", "virtual", "void",
            "volatile", "wchar_t", "while", "xor", "xor_eq",
            // using namespace std 之后 main 中用到的名字
            "std", "cin", "cout", "endl", "getline", "istringstream", "setprecision", "size_t",
            "stod", "stoi", "string", "vector"};
        return words;
    }

    vector<string> helper_names(const string &name) const override {
        return {name + "_line"};
    }

    string render(const function_spec &spec, const template_generator &generator) const override {
        vector<string> declarations, arguments;
        string reads;
        for (auto &param : spec.parameters) {
            auto &b = generator.binding(language(), param.type);
            declarations.push_back(expand(b.declaration, param.name));
            arguments.push_back(expand(b.argument, param.name));
            reads += expand(b.read, param.name);
        }
        auto &ret = generator.binding(language(), spec.return_type);

        return fmt::format(R"(#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
using namespace std;

{0} {1}({2}) {{
    // Write your code here
    return {3};
}}

int main() {{
{4}    {0} result = {1}({5});
{6}    return 0;
}}
)",
                           ret.type, spec.name, boost::algorithm::join(declarations, ", "), ret.default_value,
                           reads, boost::algorithm::join(arguments, ", "), ret.write);
    }
};

}  // namespace

void register_cpp_template(template_generator &generator) {
    generator.register_language(make_unique<cpp_template>());

    type_binding int_binding;
    int_binding.type = "int";
    int_binding.declaration = "int ${name}";
    int_binding.read = R"(    string ${name}_line;
    getline(cin, ${name}_line);
    int ${name} = stoi(${name}_line);
)";
    int_binding.write = "    cout << result << endl;\n";
    int_binding.default_value = "0";
    generator.register_type("cpp", semantic_type::INT, int_binding);

    type_binding float_binding;
    float_binding.type = "double";
    float_binding.declaration = "double ${name}";
    float_binding.read = R"(    string ${name}_line;
    getline(cin, ${name}_line);
    double ${name} = stod(${name}_line);
)";
    float_binding.write = "    cout << setprecision(17) << result << endl;\n";
    float_binding.default_value = "0.0";
    generator.register_type("cpp", semantic_type::FLOAT, float_binding);

    type_binding string_binding;
    string_binding.type = "string";
    string_binding.declaration = "string ${name}";
    string_binding.read = R"(    string ${name};
    getline(cin, ${name});
)";
    string_binding.write = "    cout << result << endl;\n";
    string_binding.default_value = "\"\"";
    generator.register_type("cpp", semantic_type::STRING, string_binding);

    type_binding bool_binding;
    bool_binding.type = "bool";
    bool_binding.declaration = "bool ${name}";
    bool_binding.read = R"(    string ${name}_line;
    getline(cin, ${name}_line);
    bool ${name} = ${name}_line == "true" || ${name}_line == "True" || ${name}_line == "1";
)";
    bool_binding.write = "    cout << (result ? \"true\" : \"false\") << endl;\n";
    bool_binding.default_value = "false";
    generator.register_type("cpp", semantic_type::BOOL, bool_binding);

    type_binding list_int_binding;
    list_int_binding.type = "vector<int>";
    list_int_binding.declaration = "vector<int> &${name}";
    list_int_binding.read = cpp_list_read("int", "value");
    list_int_binding.write = fmt::format(fmt::runtime(CPP_LIST_WRITE), "result[i]");
    list_int_binding.default_value = "{}";
    generator.register_type("cpp", semantic_type::LIST_INT, list_int_binding);

    type_binding list_float_binding;
    list_float_binding.type = "vector<double>";
    list_float_binding.declaration = "vector<double> &${name}";
    list_float_binding.read = cpp_list_read("double", "value");
    list_float_binding.write = fmt::format(fmt::runtime(CPP_LIST_WRITE), "setprecision(17) << result[i]");
    list_float_binding.default_value = "{}";
    generator.register_type("cpp", semantic_type::LIST_FLOAT, list_float_binding);

    type_binding list_string_binding;
    list_string_binding.type = "vector<string>";
    list_string_binding.declaration = "vector<string> &${name}";
    list_string_binding.read = cpp_list_read("string", "value");
    list_string_binding.write = fmt::format(fmt::runtime(CPP_LIST_WRITE), "result[i]");
    list_string_binding.default_value = "{}";
    generator.register_type("cpp", semantic_type::LIST_STRING, list_string_binding);

    type_binding list_bool_binding;
    list_bool_binding.type = "vector<bool>";
    list_bool_binding.declaration = "vector<bool> &${name}";
    list_bool_binding.read = cpp_list_read("bool", R"(value == "true" || value == "True" || value == "1")");
    list_bool_binding.write = fmt::format(fmt::runtime(CPP_LIST_WRITE), R"((result[i] ? "true" : "false"))");
    list_bool_binding.default_value = "{}";
    generator.register_type("cpp", semantic_type::LIST_BOOL, list_bool_binding);
}

}  // namespace codejudge
