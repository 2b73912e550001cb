#include "codejudge/judge/submission.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/json_utils.hpp"

namespace codejudge {
using namespace std;

evaluation_mode parse_evaluation_mode(const string &mode) {
    string name = boost::algorithm::to_lower_copy(mode);
    if (name == "run") return evaluation_mode::RUN;
    if (name == "submit") return evaluation_mode::SUBMIT;
    throw malformed_input_error("Unknown evaluation mode: " + mode);
}

const char *get_mode_name(evaluation_mode mode) {
    return mode == evaluation_mode::RUN ? "run" : "submit";
}

static string first_of(const nlohmann::ordered_json &j, const string &snake, const string &camel) {
    const nlohmann::ordered_json *value = find_path(j, snake);
    if (!value || value->is_null()) value = find_path(j, camel);
    if (!value || value->is_null()) throw build_malformed_input(j, snake);
    return value->is_string() ? value->get<string>() : value->dump();
}

test_case parse_test_case(const nlohmann::ordered_json &j, size_t index) {
    if (!j.is_object())
        throw malformed_input_error("Test case should be an object: " + j.dump());

    test_case tc;
    if (exists(j, "id"))
        tc.id = j.at("id").is_string() ? j.at("id").get<string>() : j.at("id").dump();
    else
        tc.id = to_string(index + 1);
    tc.input_data = first_of(j, "input_data", "inputData");
    tc.expected_output = first_of(j, "expected_output", "expectedOutput");
    tc.is_hidden = get_value_def<bool>(j, get_value_def<bool>(j, false, "isHidden"), "is_hidden");
    return tc;
}

// 选手程序的输出可能不是合法的 UTF-8，序列化时会抛出异常，这里把非 ASCII 字节替换掉
static string printable(const string &text) {
    if (utf8_check_is_valid(text)) return text;
    string result = text;
    for (char &c : result)
        if ((unsigned char)c >= 0x80) c = '?';
    return result;
}

nlohmann::json to_json(const test_case_result &result) {
    nlohmann::json j = {
        {"testCaseId", result.test_case_id},
        {"status", get_display_message(result.result)},
        {"passed", result.passed},
        {"durationMs", result.duration},
        {"isHidden", result.is_hidden}};
    if (!result.is_hidden) {
        j["input"] = printable(result.input);
        j["expectedOutput"] = printable(result.expected_output);
        j["actualOutput"] = printable(result.actual_output);
        if (!result.error_message.empty())
            j["errorMessage"] = printable(result.error_message);
    }
    return j;
}

nlohmann::json to_json(const submission_result &result) {
    nlohmann::json results = nlohmann::json::array();
    for (auto &r : result.results) results.push_back(to_json(r));

    nlohmann::json j = {
        {"status", get_display_message(result.result)},
        {"message", result.message},
        {"results", results},
        {"totalTests", result.total_tests},
        {"passedTests", result.passed_tests},
        {"totalDurationMs", result.total_duration}};
    if (!result.compile_log.empty())
        j["compileLog"] = printable(result.compile_log);
    return j;
}

}  // namespace codejudge
