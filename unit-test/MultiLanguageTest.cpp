#include <algorithm>
#include "gtest/gtest.h"
#include "codejudge/server/judge_service.hpp"
#include "test/languages.hpp"

using namespace std;
using namespace codejudge;

/**
 * 从代码模板出发的端到端测试
 * 把模板中函数的空实现替换为正确的实现，再用自动生成的 main 函数读入测试数据并评测。
 * 评测机上没有安装对应语言的编译器时跳过。
 */
class MultiLanguageTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        service = new judge_service(language_registry::default_languages(), nullptr, 1);
    }

    static void TearDownTestCase() {
        delete service;
        service = nullptr;
    }

    static function_spec two_sum() {
        function_spec spec;
        spec.name = "twoSum";
        spec.parameters = {{"nums", semantic_type::LIST_INT}, {"target", semantic_type::INT}};
        spec.return_type = semantic_type::LIST_INT;
        return spec;
    }

    static vector<test_case> two_sum_tests() {
        return {
            {"1", R"({"nums": [2, 7, 11, 15], "target": 9})", "[0,1]", false},
            {"2", R"({"nums": [3, 2, 4], "target": 6})", "[1, 2]", false},
            {"3", R"({"nums": [3, 3], "target": 6})", "0 1", true},
            {"4", R"({"nums": [-1, -2, -3, -4, -5], "target": -8})", "[2,4]", true}};
    }

    /**
     * @param stub 模板中函数的空实现
     * @param body 替换后的实现
     */
    void test(const string &language, const function_spec &spec, const string &stub, const string &body,
              const vector<test_case> &tests) {
        string code = service->generate_template(spec, language);
        size_t pos = code.find(stub);
        ASSERT_NE(pos, string::npos) << code;
        code.replace(pos, stub.size(), body);

        size_t visible = count_if(tests.begin(), tests.end(), [](const test_case &tc) { return !tc.is_hidden; });
        for (auto mode : {evaluation_mode::RUN, evaluation_mode::SUBMIT}) {
            evaluation_request request;
            request.language = language;
            request.source = code;
            request.test_cases = tests;
            request.mode = mode;
            request.time_limit = 10;
            request.parameters = spec.parameters;
            request.return_type = spec.return_type;
            auto result = service->evaluate(request);
            EXPECT_EQ(result.result, status::ACCEPTED) << result.compile_log << endl
                                                       << code;
            // 运行模式只评测公开的测试数据
            EXPECT_EQ(result.passed_tests, mode == evaluation_mode::RUN ? visible : tests.size());
        }
    }

    static judge_service *service;
};

judge_service *MultiLanguageTest::service = nullptr;

TEST_F(MultiLanguageTest, CTest) {
    if (!has_program("gcc")) GTEST_SKIP() << "gcc is not installed";
    test("c", two_sum(), "    // Write your code here\n    *returnSize = 0;\n    return NULL;\n", R"(    int *answer = malloc(sizeof(int) * 2);
    *returnSize = 0;
    for (int i = 0; i < numsSize; i++)
        for (int j = i + 1; j < numsSize; j++)
            if (nums[i] + nums[j] == target) {
                answer[0] = i;
                answer[1] = j;
                *returnSize = 2;
                return answer;
            }
    return answer;
)", two_sum_tests());
}

TEST_F(MultiLanguageTest, CppTest) {
    if (!has_program("g++")) GTEST_SKIP() << "g++ is not installed";
    test("cpp", two_sum(), "    // Write your code here\n    return {};\n", R"(    for (size_t i = 0; i < nums.size(); ++i)
        for (size_t j = i + 1; j < nums.size(); ++j)
            if (nums[i] + nums[j] == target) return {(int) i, (int) j};
    return {};
)", two_sum_tests());
}

TEST_F(MultiLanguageTest, PythonTest) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";
    test("python", two_sum(), "    # Write your code here\n    pass\n", R"(    seen = {}
    for i, num in enumerate(nums):
        if target - num in seen:
            return [seen[target - num], i]
        seen[num] = i
    return []
)", two_sum_tests());
}

TEST_F(MultiLanguageTest, JavaScriptTest) {
    if (!has_program("node")) GTEST_SKIP() << "node is not installed";
    test("javascript", two_sum(), "    // Write your code here\n", R"(    const seen = new Map();
    for (let j = 0; j < nums.length; j++) {
        if (seen.has(target - nums[j])) return [seen.get(target - nums[j]), j];
        seen.set(nums[j], j);
    }
    return [];
)", two_sum_tests());
}

TEST_F(MultiLanguageTest, JavaTest) {
    if (!has_program("javac") || !has_program("java")) GTEST_SKIP() << "java is not installed";
    test("java", two_sum(), "        // Write your code here\n        return null;\n", R"(        for (int i = 0; i < nums.length; i++)
            for (int j = i + 1; j < nums.length; j++)
                if (nums[i] + nums[j] == target) return new int[] {i, j};
        return new int[0];
)", two_sum_tests());
}

TEST_F(MultiLanguageTest, PythonScalarTypes) {
    if (!has_program("python3")) GTEST_SKIP() << "python3 is not installed";
    function_spec spec;
    spec.name = "isPalindrome";
    spec.parameters = {{"s", semantic_type::STRING}, {"ignoreCase", semantic_type::BOOL}};
    spec.return_type = semantic_type::BOOL;
    test("python", spec, "    # Write your code here\n    pass\n", R"(    if ignoreCase:
        s = s.lower()
    return s == s[::-1]
)", {
        {"1", R"({"s": "Level", "ignoreCase": true})", "true", false},
        {"2", R"({"s": "Level", "ignoreCase": false})", "false", false},
        {"3", R"({"s": "ab ba", "ignoreCase": false})", "True", false}});
}

TEST_F(MultiLanguageTest, CppFloatList) {
    if (!has_program("g++")) GTEST_SKIP() << "g++ is not installed";
    function_spec spec;
    spec.name = "scale";
    spec.parameters = {{"values", semantic_type::LIST_FLOAT}, {"factor", semantic_type::FLOAT}};
    spec.return_type = semantic_type::LIST_FLOAT;
    test("cpp", spec, "    // Write your code here\n    return {};\n", R"(    vector<double> scaled;
    for (double v : values) scaled.push_back(v * factor);
    return scaled;
)", {
        {"1", R"({"values": [0.1, 0.2], "factor": 3})", "[0.3, 0.6]", false},
        {"2", R"({"values": [], "factor": 2.5})", "[]", false}});
}
