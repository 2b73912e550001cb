#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "codejudge/template/generator.hpp"

namespace codejudge {
using namespace std;

namespace {

const char *JAVA_LIST_WRITE = R"(        StringBuilder output = new StringBuilder("[");
        for (int i = 0; i < result.length; i++) {{
            if (i > 0) output.append(",");
            output.append({});
        }}
        output.append("]");
        System.out.println(output);
)";

struct java_template : public language_template {
    string language() const override {
        return "java";
    }

    const set<string> &reserved_words() const override {
        static const set<string> words = {
            "abstract", "assert", "boolean", "break", "byte", "case", "catch", "char", "class",
            "const", "continue", "default", "do", "double", "else", "enum", "extends", "final",
            "finally", "float", "for", "goto", "if", "implements", "import", "instanceof", "int",
            "interface", "long", "native", "new", "package", "private", "protected", "public",
            "return", "short", "static", "strictfp", "super", "switch", "synchronized", "this",
            "throw", "throws", "transient", "try", "void", "volatile", "while", "true", "false",
            "null", "var", "_",
            // main 中引用的类
            "Arrays", "BufferedReader", "Double", "IOException", "InputStreamReader", "Integer",
            "Solution", "String", "StringBuilder", "System"};
        return words;
    }

    vector<string> helper_names(const string &name) const override {
        return {name + "Line", name + "Tokens"};
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

        return fmt::format(R"(import java.io.*;
import java.util.*;

public class Solution {{
    public static {0} {1}({2}) {{
        // Write your code here
        return {3};
    }}

    public static void main(String[] args) throws IOException {{
        BufferedReader reader = new BufferedReader(new InputStreamReader(System.in));
{4}        {0} result = {1}({5});
{6}    }}
}}
)",
                           ret.type, spec.name, boost::algorithm::join(declarations, ", "), ret.default_value,
                           reads, boost::algorithm::join(arguments, ", "), ret.write);
    }
};

void register_binding(template_generator &generator, semantic_type type, const string &type_name, const string &read, const string &write, const string &default_value) {
    type_binding binding;
    binding.type = type_name;
    binding.declaration = type_name + " ${name}";
    binding.read = read;
    binding.write = write;
    binding.default_value = default_value;
    generator.register_type("java", type, binding);
}

string java_list_read(const string &type_name, const string &map) {
    return fmt::format(R"(        String ${{name}}Line = reader.readLine();
        {0} ${{name}} = ${{name}}Line == null || ${{name}}Line.trim().isEmpty()
            ? new {1}
            : {2};
)",
                       type_name, type_name.substr(0, type_name.size() - 1) + "0]", map);
}

}  // namespace

void register_java_template(template_generator &generator) {
    generator.register_language(make_unique<java_template>());

    register_binding(generator, semantic_type::INT, "int",
                     "        int ${name} = Integer.parseInt(reader.readLine().trim());\n",
                     "        System.out.println(result);\n", "0");
    register_binding(generator, semantic_type::FLOAT, "double",
                     "        double ${name} = Double.parseDouble(reader.readLine().trim());\n",
                     "        System.out.println(result);\n", "0.0");
    register_binding(generator, semantic_type::STRING, "String",
                     R"(        String ${name} = reader.readLine();
        if (${name} == null) ${name} = "";
)",
                     "        System.out.println(result);\n", "\"\"");
    register_binding(generator, semantic_type::BOOL, "boolean",
                     R"(        String ${name}Line = reader.readLine().trim();
        boolean ${name} = ${name}Line.equalsIgnoreCase("true") || ${name}Line.equals("1");
)",
                     "        System.out.println(result ? \"true\" : \"false\");\n", "false");
    register_binding(generator, semantic_type::LIST_INT, "int[]",
                     java_list_read("int[]", "Arrays.stream(${name}Line.trim().split(\"\\\\s+\")).mapToInt(Integer::parseInt).toArray()"),
                     fmt::format(fmt::runtime(JAVA_LIST_WRITE), "result[i]"), "null");
    register_binding(generator, semantic_type::LIST_FLOAT, "double[]",
                     java_list_read("double[]", "Arrays.stream(${name}Line.trim().split(\"\\\\s+\")).mapToDouble(Double::parseDouble).toArray()"),
                     fmt::format(fmt::runtime(JAVA_LIST_WRITE), "result[i]"), "null");
    register_binding(generator, semantic_type::LIST_STRING, "String[]",
                     java_list_read("String[]", "${name}Line.trim().split(\"\\\\s+\")"),
                     fmt::format(fmt::runtime(JAVA_LIST_WRITE), "result[i]"), "null");

    // Java 没有 boolean 流，逐个转换
    register_binding(generator, semantic_type::LIST_BOOL, "boolean[]",
                     R"(        String ${name}Line = reader.readLine();
        String[] ${name}Tokens = ${name}Line == null || ${name}Line.trim().isEmpty()
            ? new String[0]
            : ${name}Line.trim().split("\\s+");
        boolean[] ${name} = new boolean[${name}Tokens.length];
        for (int i = 0; i < ${name}Tokens.length; i++)
            ${name}[i] = ${name}Tokens[i].equalsIgnoreCase("true") || ${name}Tokens[i].equals("1");
)",
                     fmt::format(fmt::runtime(JAVA_LIST_WRITE), "result[i] ? \"true\" : \"false\""), "null");
}

}  // namespace codejudge
