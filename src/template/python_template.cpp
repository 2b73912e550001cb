#include <boost/algorithm/string/join.hpp>
#include <fmt/core.h>
#include "codejudge/template/generator.hpp"

namespace codejudge {
using namespace std;

namespace {

struct python_template : public language_template {
    string language() const override {
        return "python";
    }

    const set<string> &reserved_words() const override {
        static const set<string> words = {
            "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
            "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
            "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
            "return", "try", "while", "with", "yield",
            // main 中调用的内置函数和类型
            "List", "bool", "float", "input", "int", "print", "repr", "str", "typing"};
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

        return fmt::format(R"(from typing import List


def {0}({1}) -> {2}:
    # Write your code here
    pass


if __name__ == "__main__":
{3}    result = {0}({4})
{5})",
                           spec.name, boost::algorithm::join(declarations, ", "), ret.type,
                           reads, boost::algorithm::join(arguments, ", "), ret.write);
    }
};

void register_binding(template_generator &generator, semantic_type type, const string &type_name, const string &read, const string &write) {
    type_binding binding;
    binding.type = type_name;
    binding.declaration = "${name}: " + type_name;
    binding.read = read;
    binding.write = write;
    generator.register_type("python", type, binding);
}

}  // namespace

void register_python_template(template_generator &generator) {
    generator.register_language(make_unique<python_template>());

    register_binding(generator, semantic_type::INT, "int",
                     "    ${name} = int(input())\n",
                     "    print(result)\n");
    register_binding(generator, semantic_type::FLOAT, "float",
                     "    ${name} = float(input())\n",
                     "    print(repr(float(result)))\n");
    register_binding(generator, semantic_type::STRING, "str",
                     "    ${name} = input()\n",
                     "    print(result)\n");
    register_binding(generator, semantic_type::BOOL, "bool",
                     "    ${name} = input().strip().lower() in (\"true\", \"1\")\n",
                     "    print(\"true\" if result else \"false\")\n");
    register_binding(generator, semantic_type::LIST_INT, "List[int]",
                     "    ${name} = [int(e) for e in input().split()]\n",
                     "    print(\"[\" + \",\".join(str(e) for e in result) + \"]\")\n");
    register_binding(generator, semantic_type::LIST_FLOAT, "List[float]",
                     "    ${name} = [float(e) for e in input().split()]\n",
                     "    print(\"[\" + \",\".join(repr(float(e)) for e in result) + \"]\")\n");
    register_binding(generator, semantic_type::LIST_STRING, "List[str]",
                     "    ${name} = input().split()\n",
                     "    print(\"[\" + \",\".join(result) + \"]\")\n");
    register_binding(generator, semantic_type::LIST_BOOL, "List[bool]",
                     "    ${name} = [e.lower() in (\"true\", \"1\") for e in input().split()]\n",
                     "    print(\"[\" + \",\".join(\"true\" if e else \"false\" for e in result) + \"]\")\n");
}

}  // namespace codejudge
