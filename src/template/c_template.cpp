#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "codejudge/template/generator.hpp"

namespace codejudge {
using namespace std;

namespace {

const char *C_LIST_WRITE = R"(    printf("[");
    for (int i = 0; i < returnSize; i++) {{
        if (i > 0) printf(",");
        printf({});
    }}
    printf("]\n");
)";

string c_list_read(const string &element_type, const string &convert) {
    return fmt::format(R"(    char *${{name}}_line = read_line();
    int ${{name}}Size = 0;
    {0} *${{name}} = malloc((strlen(${{name}}_line) / 2 + 1) * sizeof({0}));
    for (char *token = strtok(${{name}}_line, " \t"); token != NULL; token = strtok(NULL, " \t"))
        ${{name}}[${{name}}Size++] = {1};
)",
                       element_type, convert);
}

struct c_template : public language_template {
    string language() const override {
        return "c";
    }

    const set<string> &reserved_words() const override {
        static const set<string> words = {
            "auto", "break", "case", "char", "const", "continue", "default", "do", "double", "else",
            "enum", "extern", "float", "for", "goto", "if", "inline", "int", "long", "register",
            "restrict", "return", "short", "signed", "sizeof", "static", "struct", "switch",
            "typedef", "union", "unsigned", "void", "volatile", "while",
            // stdbool.h 的宏，以及 main 中用到的库函数和辅助函数
            "bool", "true", "false", "NULL", "EOF", "getchar", "malloc", "printf", "read_line",
            "realloc", "size_t", "strcasecmp", "strcmp", "strlen", "strtod", "strtok", "strtol"};
        return words;
    }

    vector<string> helper_names(const string &name) const override {
        return {name + "Size", name + "_line"};
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

        // C 的数组不携带长度，返回列表时由调用方传入 returnSize 接收长度
        string stub_body = "    return " + ret.default_value + ";\n";
        string call = fmt::format("    {} result = {}({});\n", ret.type, spec.name, boost::algorithm::join(arguments, ", "));
        if (is_list_type(spec.return_type)) {
            declarations.push_back("int *returnSize");
            arguments.push_back("&returnSize");
            stub_body = "    *returnSize = 0;\n" + stub_body;
            call = fmt::format("    int returnSize = 0;\n    {} result = {}({});\n", ret.type, spec.name, boost::algorithm::join(arguments, ", "));
        }

        return fmt::format(R"(#include <stdbool.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

{0} {1}({2}) {{
    // Write your code here
{3}}}

static char *read_line(void) {{
    size_t capacity = 64, length = 0;
    char *line = malloc(capacity);
    int c;
    while ((c = getchar()) != EOF && c != '\n') {{
        if (length + 1 >= capacity) line = realloc(line, capacity *= 2);
        line[length++] = (char) c;
    }}
    if (length > 0 && line[length - 1] == '\r') length--;
    line[length] = '\0';
    return line;
}}

int main(void) {{
{4}{5}{6}    return 0;
}}
)",
                           ret.type, spec.name, boost::algorithm::join(declarations, ", "), stub_body,
                           reads, call, ret.write);
    }
};

}  // namespace

void register_c_template(template_generator &generator) {
    generator.register_language(make_unique<c_template>());

    type_binding int_binding;
    int_binding.type = "int";
    int_binding.declaration = "int ${name}";
    int_binding.read = "    int ${name} = (int) strtol(read_line(), NULL, 10);\n";
    int_binding.write = "    printf(\"%d\\n\", result);\n";
    int_binding.default_value = "0";
    generator.register_type("c", semantic_type::INT, int_binding);

    type_binding float_binding;
    float_binding.type = "double";
    float_binding.declaration = "double ${name}";
    float_binding.read = "    double ${name} = strtod(read_line(), NULL);\n";
    float_binding.write = "    printf(\"%.17g\\n\", result);\n";
    float_binding.default_value = "0.0";
    generator.register_type("c", semantic_type::FLOAT, float_binding);

    type_binding string_binding;
    string_binding.type = "char *";
    string_binding.declaration = "char *${name}";
    string_binding.read = "    char *${name} = read_line();\n";
    string_binding.write = "    printf(\"%s\\n\", result);\n";
    string_binding.default_value = "\"\"";
    generator.register_type("c", semantic_type::STRING, string_binding);

    type_binding bool_binding;
    bool_binding.type = "bool";
    bool_binding.declaration = "bool ${name}";
    bool_binding.read = R"(    char *${name}_line = read_line();
    bool ${name} = strcasecmp(${name}_line, "true") == 0 || strcmp(${name}_line, "1") == 0;
)";
    bool_binding.write = "    printf(\"%s\\n\", result ? \"true\" : \"false\");\n";
    bool_binding.default_value = "false";
    generator.register_type("c", semantic_type::BOOL, bool_binding);

    type_binding list_int_binding;
    list_int_binding.type = "int *";
    list_int_binding.declaration = "int *${name}, int ${name}Size";
    list_int_binding.argument = "${name}, ${name}Size";
    list_int_binding.read = c_list_read("int", "(int) strtol(token, NULL, 10)");
    list_int_binding.write = fmt::format(fmt::runtime(C_LIST_WRITE), "\"%d\", result[i]");
    list_int_binding.default_value = "NULL";
    generator.register_type("c", semantic_type::LIST_INT, list_int_binding);

    type_binding list_float_binding;
    list_float_binding.type = "double *";
    list_float_binding.declaration = "double *${name}, int ${name}Size";
    list_float_binding.argument = "${name}, ${name}Size";
    list_float_binding.read = c_list_read("double", "strtod(token, NULL)");
    list_float_binding.write = fmt::format(fmt::runtime(C_LIST_WRITE), "\"%.17g\", result[i]");
    list_float_binding.default_value = "NULL";
    generator.register_type("c", semantic_type::LIST_FLOAT, list_float_binding);

    type_binding list_string_binding;
    list_string_binding.type = "char **";
    list_string_binding.declaration = "char **${name}, int ${name}Size";
    list_string_binding.argument = "${name}, ${name}Size";
    list_string_binding.read = c_list_read("char *", "token");
    list_string_binding.write = fmt::format(fmt::runtime(C_LIST_WRITE), "\"%s\", result[i]");
    list_string_binding.default_value = "NULL";
    generator.register_type("c", semantic_type::LIST_STRING, list_string_binding);

    type_binding list_bool_binding;
    list_bool_binding.type = "bool *";
    list_bool_binding.declaration = "bool *${name}, int ${name}Size";
    list_bool_binding.argument = "${name}, ${name}Size";
    list_bool_binding.read = c_list_read("bool", R"(strcasecmp(token, "true") == 0 || strcmp(token, "1") == 0)");
    list_bool_binding.write = fmt::format(fmt::runtime(C_LIST_WRITE), R"("%s", result[i] ? "true" : "false")");
    list_bool_binding.default_value = "NULL";
    generator.register_type("c", semantic_type::LIST_BOOL, list_bool_binding);
}

}  // namespace codejudge
