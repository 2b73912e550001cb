#include "codejudge/template/generator.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

string expand(const string &pattern, const string &name) {
    return boost::algorithm::replace_all_copy(pattern, "${name}", name);
}

language_template::~language_template() {}

const set<string> &language_template::reserved_words() const {
    static const set<string> empty;
    return empty;
}

vector<string> language_template::helper_names(const string &) const {
    return {};
}

static void check_reserved(const function_spec &spec, const language_template &lang) {
    auto &reserved = lang.reserved_words();
    set<string> helpers;
    for (auto &param : spec.parameters) {
        for (auto &helper : lang.helper_names(param.name)) {
            if (reserved.count(helper))
                throw malformed_input_error(fmt::format("Parameter name '{}' makes the {} template declare reserved name '{}'", param.name, lang.language(), helper));
            helpers.insert(helper);
        }
    }

    vector<string> identifiers = {spec.name};
    for (auto &param : spec.parameters) identifiers.push_back(param.name);
    for (auto &name : identifiers) {
        if (reserved.count(name))
            throw malformed_input_error(fmt::format("'{}' is reserved in language {}", name, lang.language()));
        if (helpers.count(name))
            throw malformed_input_error(fmt::format("'{}' clashes with a local variable of the {} template", name, lang.language()));
    }
}

void template_generator::register_language(unique_ptr<language_template> &&lang) {
    string name = lang->language();
    templates[name] = move(lang);
}

void template_generator::register_type(const string &language, semantic_type type, type_binding binding) {
    bindings[{language, type}] = move(binding);
}

const type_binding &template_generator::binding(const string &language, semantic_type type) const {
    auto it = bindings.find({language, type});
    if (it == bindings.end())
        throw unsupported_type_error("Type " + string(get_type_name(type)) + " is not supported in language " + language);
    return it->second;
}

bool template_generator::supports(const string &language) const {
    return templates.count(language);
}

vector<string> template_generator::languages() const {
    vector<string> names;
    for (auto &[name, lang] : templates) names.push_back(name);
    return names;
}

string template_generator::generate(const function_spec &spec, const string &language) const {
    auto it = templates.find(language);
    if (it == templates.end())
        throw unsupported_language_error("Unsupported language: " + language);
    validate(spec);
    check_reserved(spec, *it->second);

    // 先检查所有类型都受支持，避免生成到一半才失败
    for (auto &param : spec.parameters) binding(language, param.type);
    binding(language, spec.return_type);

    return it->second->render(spec, *this);
}

void register_builtin_templates(template_generator &generator) {
    register_python_template(generator);
    register_javascript_template(generator);
    register_cpp_template(generator);
    register_java_template(generator);
    register_c_template(generator);
    DLOG(INFO) << "Registered code templates for " << generator.languages().size() << " languages";
}

}  // namespace codejudge
