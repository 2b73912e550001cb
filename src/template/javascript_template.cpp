#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "codejudge/template/generator.hpp"

namespace codejudge {
using namespace std;

namespace {

struct javascript_template : public language_template {
    string language() const override {
        return "javascript";
    }

    const set<string> &reserved_words() const override {
        static const set<string> words = {
            "await", "break", "case", "catch", "class", "const", "continue", "debugger", "default",
            "delete", "do", "else", "enum", "export", "extends", "false", "finally", "for",
            "function", "if", "implements", "import", "in", "instanceof", "interface", "let", "new",
            "null", "package", "private", "protected", "public", "return", "static", "super",
            "switch", "this", "throw", "true", "try", "typeof", "var", "void", "while", "with",
            "yield", "arguments", "eval", "undefined", "NaN", "Infinity",
            // CommonJS 模块作用域中的名字，以及 main 中用到的全局对象
            "require", "module", "exports", "console", "parseInt", "parseFloat", "String"};
        return words;
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

        return fmt::format(R"(/**
{0} * @return {{{1}}}
 */
function {2}({3}) {{
    // Write your code here
}}

const lines = require("fs").readFileSync(0, "utf8").split("\n");
let i = 0;
{4}const result = {2}({5});
{6})",
                           jsdoc(spec, generator), ret.type, spec.name,
                           boost::algorithm::join(declarations, ", "),
                           reads, boost::algorithm::join(arguments, ", "), ret.write);
    }

private:
    string jsdoc(const function_spec &spec, const template_generator &generator) const {
        string doc;
        for (auto &param : spec.parameters)
            doc += fmt::format(" * @param {{{}}} {}\n", generator.binding(language(), param.type).type, param.name);
        return doc;
    }
};

void register_binding(template_generator &generator, semantic_type type, const string &type_name, const string &read, const string &write) {
    type_binding binding;
    binding.type = type_name;
    binding.declaration = "${name}";
    binding.read = read;
    binding.write = write;
    generator.register_type("javascript", type, binding);
}

}  // namespace

void register_javascript_template(template_generator &generator) {
    generator.register_language(make_unique<javascript_template>());

    register_binding(generator, semantic_type::INT, "number",
                     "const ${name} = parseInt(lines[i++], 10);\n",
                     "console.log(String(result));\n");
    register_binding(generator, semantic_type::FLOAT, "number",
                     "const ${name} = parseFloat(lines[i++]);\n",
                     "console.log(String(result));\n");
    register_binding(generator, semantic_type::STRING, "string",
                     "const ${name} = (lines[i++] || \"\").replace(/\\r$/, \"\");\n",
                     "console.log(result);\n");
    register_binding(generator, semantic_type::BOOL, "boolean",
                     "const ${name} = [\"true\", \"1\"].includes((lines[i++] || \"\").trim().toLowerCase());\n",
                     "console.log(result ? \"true\" : \"false\");\n");
    register_binding(generator, semantic_type::LIST_INT, "number[]",
                     "const ${name} = (lines[i++] || \"\").split(/\\s+/).filter(e => e.length > 0).map(e => parseInt(e, 10));\n",
                     "console.log(\"[\" + result.join(\",\") + \"]\");\n");
    register_binding(generator, semantic_type::LIST_FLOAT, "number[]",
                     "const ${name} = (lines[i++] || \"\").split(/\\s+/).filter(e => e.length > 0).map(e => parseFloat(e));\n",
                     "console.log(\"[\" + result.join(\",\") + \"]\");\n");
    register_binding(generator, semantic_type::LIST_STRING, "string[]",
                     "const ${name} = (lines[i++] || \"\").split(/\\s+/).filter(e => e.length > 0);\n",
                     "console.log(\"[\" + result.join(\",\") + \"]\");\n");
    register_binding(generator, semantic_type::LIST_BOOL, "boolean[]",
                     "const ${name} = (lines[i++] || \"\").split(/\\s+/).filter(e => e.length > 0).map(e => [\"true\", \"1\"].includes(e.toLowerCase()));\n",
                     "console.log(\"[\" + result.map(e => e ? \"true\" : \"false\").join(\",\") + \"]\");\n");
}

}  // namespace codejudge
