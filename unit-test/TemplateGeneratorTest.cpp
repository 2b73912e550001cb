#include "gtest/gtest.h"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/template/generator.hpp"
using namespace std;
using namespace codejudge;

class TemplateGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        register_builtin_templates(generator);
        two_sum.name = "twoSum";
        two_sum.parameters = {{"nums", semantic_type::LIST_INT}, {"target", semantic_type::INT}};
        two_sum.return_type = semantic_type::LIST_INT;
    }

    static bool contains(const string &text, const string &part) {
        return text.find(part) != string::npos;
    }

    template_generator generator;
    function_spec two_sum;
};

TEST_F(TemplateGeneratorTest, BuiltinLanguages) {
    vector<string> expected = {"c", "cpp", "java", "javascript", "python"};
    EXPECT_EQ(generator.languages(), expected);
    EXPECT_TRUE(generator.supports("python"));
    EXPECT_FALSE(generator.supports("ruby"));
}

TEST_F(TemplateGeneratorTest, Deterministic) {
    for (auto &language : generator.languages())
        EXPECT_EQ(generator.generate(two_sum, language), generator.generate(two_sum, language)) << language;
}

TEST_F(TemplateGeneratorTest, Python) {
    string code = generator.generate(two_sum, "python");
    EXPECT_TRUE(contains(code, "def twoSum(nums: List[int], target: int) -> List[int]:"));
    EXPECT_TRUE(contains(code, "if __name__ == \"__main__\":"));
    EXPECT_TRUE(contains(code, "nums = [int(e) for e in input().split()]"));
    EXPECT_TRUE(contains(code, "target = int(input())"));
    EXPECT_TRUE(contains(code, "result = twoSum(nums, target)"));
}

TEST_F(TemplateGeneratorTest, JavaScript) {
    string code = generator.generate(two_sum, "javascript");
    EXPECT_TRUE(contains(code, " * @param {number[]} nums\n"));
    EXPECT_TRUE(contains(code, " * @param {number} target\n"));
    EXPECT_TRUE(contains(code, " * @return {number[]}\n"));
    EXPECT_TRUE(contains(code, "function twoSum(nums, target) {"));
    EXPECT_TRUE(contains(code, "const result = twoSum(nums, target);"));
}

TEST_F(TemplateGeneratorTest, Cpp) {
    string code = generator.generate(two_sum, "cpp");
    EXPECT_TRUE(contains(code, "vector<int> twoSum(vector<int> &nums, int target) {"));
    EXPECT_TRUE(contains(code, "return {};"));
    EXPECT_TRUE(contains(code, "vector<int> result = twoSum(nums, target);"));
    EXPECT_TRUE(contains(code, "int main() {"));
}

TEST_F(TemplateGeneratorTest, Java) {
    string code = generator.generate(two_sum, "java");
    EXPECT_TRUE(contains(code, "public class Solution {"));
    EXPECT_TRUE(contains(code, "public static int[] twoSum(int[] nums, int target) {"));
    EXPECT_TRUE(contains(code, "return null;"));
    EXPECT_TRUE(contains(code, "int[] result = twoSum(nums, target);"));
}

TEST_F(TemplateGeneratorTest, C) {
    string code = generator.generate(two_sum, "c");
    EXPECT_TRUE(contains(code, "int * twoSum(int *nums, int numsSize, int target, int *returnSize) {"));
    EXPECT_TRUE(contains(code, "*returnSize = 0;"));
    EXPECT_TRUE(contains(code, "int returnSize = 0;"));
    EXPECT_TRUE(contains(code, "int * result = twoSum(nums, numsSize, target, &returnSize);"));
}

TEST_F(TemplateGeneratorTest, NoParameters) {
    function_spec spec;
    spec.name = "answer";
    spec.return_type = semantic_type::STRING;
    EXPECT_TRUE(contains(generator.generate(spec, "python"), "def answer() -> str:"));
    EXPECT_TRUE(contains(generator.generate(spec, "cpp"), "string answer() {"));
    EXPECT_TRUE(contains(generator.generate(spec, "java"), "public static String answer() {"));
}

TEST_F(TemplateGeneratorTest, AllTypesSupported) {
    vector<semantic_type> types = {
        semantic_type::INT, semantic_type::FLOAT, semantic_type::STRING, semantic_type::BOOL,
        semantic_type::LIST_INT, semantic_type::LIST_FLOAT, semantic_type::LIST_STRING, semantic_type::LIST_BOOL};
    for (auto &language : generator.languages()) {
        for (auto type : types) {
            function_spec spec;
            spec.name = "f";
            spec.parameters = {{"x", type}};
            spec.return_type = type;
            EXPECT_NO_THROW(generator.generate(spec, language)) << language << " " << get_type_name(type);
        }
    }
}

TEST_F(TemplateGeneratorTest, UnsupportedLanguage) {
    EXPECT_THROW(generator.generate(two_sum, "ruby"), unsupported_language_error);
}

TEST_F(TemplateGeneratorTest, UnsupportedType) {
    // 只注册了 int 的语言
    struct int_only : public language_template {
        string language() const override { return "tiny"; }
        string render(const function_spec &spec, const template_generator &) const override {
            return spec.name;
        }
    };
    generator.register_language(make_unique<int_only>());
    type_binding binding;
    binding.type = "int";
    generator.register_type("tiny", semantic_type::INT, binding);

    function_spec spec;
    spec.name = "f";
    spec.return_type = semantic_type::INT;
    EXPECT_EQ(generator.generate(spec, "tiny"), "f");

    spec.parameters = {{"x", semantic_type::FLOAT}};
    EXPECT_THROW(generator.generate(spec, "tiny"), unsupported_type_error);
}

TEST_F(TemplateGeneratorTest, InvalidSpec) {
    two_sum.name = "two sum";
    EXPECT_THROW(generator.generate(two_sum, "cpp"), malformed_input_error);

    // 与代码框架中读取参数用的局部变量重名
    function_spec spec;
    spec.name = "f";
    spec.return_type = semantic_type::INT;
    spec.parameters = {{"a", semantic_type::INT}, {"a_line", semantic_type::INT}};
    EXPECT_THROW(generator.generate(spec, "cpp"), malformed_input_error);
    EXPECT_NO_THROW(generator.generate(spec, "python"));

    spec.parameters = {{"nums", semantic_type::LIST_INT}, {"numsSize", semantic_type::INT}};
    EXPECT_THROW(generator.generate(spec, "c"), malformed_input_error);
    EXPECT_NO_THROW(generator.generate(spec, "cpp"));

    spec.parameters = {{"flags", semantic_type::LIST_BOOL}, {"flagsTokens", semantic_type::INT}};
    EXPECT_THROW(generator.generate(spec, "java"), malformed_input_error);

    // 函数名与局部变量重名
    spec.name = "x_line";
    spec.parameters = {{"x", semantic_type::INT}};
    EXPECT_THROW(generator.generate(spec, "cpp"), malformed_input_error);

    // 局部变量与 C 模板的 read_line 函数重名
    spec.name = "f";
    spec.parameters = {{"read", semantic_type::BOOL}};
    EXPECT_THROW(generator.generate(spec, "c"), malformed_input_error);
}

TEST_F(TemplateGeneratorTest, ReservedWords) {
    function_spec spec;
    spec.name = "f";
    spec.return_type = semantic_type::INT;
    spec.parameters = {{"return", semantic_type::INT}};
    for (auto &language : generator.languages())
        EXPECT_THROW(generator.generate(spec, language), malformed_input_error) << language;

    // 遮盖了 main 中调用的内置函数
    spec.parameters = {{"x", semantic_type::INT}};
    spec.name = "input";
    EXPECT_THROW(generator.generate(spec, "python"), malformed_input_error);
    EXPECT_NO_THROW(generator.generate(spec, "cpp"));
    spec.name = "cout";
    EXPECT_THROW(generator.generate(spec, "cpp"), malformed_input_error);
    spec.name = "parseInt";
    EXPECT_THROW(generator.generate(spec, "javascript"), malformed_input_error);
    spec.name = "Integer";
    EXPECT_THROW(generator.generate(spec, "java"), malformed_input_error);
    spec.name = "printf";
    EXPECT_THROW(generator.generate(spec, "c"), malformed_input_error);

    // 保留字只对对应的语言生效
    spec.name = "def";
    EXPECT_THROW(generator.generate(spec, "python"), malformed_input_error);
    EXPECT_NO_THROW(generator.generate(spec, "java"));
}
