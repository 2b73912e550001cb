#include "codejudge/judge/judger.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include "codejudge/common/exceptions.hpp"
#include "codejudge/config.hpp"
#include "codejudge/judge/input_adapter.hpp"

namespace codejudge {
using namespace std;

judger::judger(sandbox &box)
    : box(box) {}

string summary_message(const submission_result &result) {
    switch (result.result) {
        case status::ACCEPTED:
            return fmt::format("Accepted! All {} test cases passed.", result.total_tests);
        case status::WRONG_ANSWER:
            return fmt::format("Wrong Answer. Passed {}/{} test cases.", result.passed_tests, result.total_tests);
        case status::TIME_LIMIT_EXCEEDED:
            return "Time Limit Exceeded.";
        case status::RUNTIME_ERROR:
            return "Runtime Error.";
        case status::COMPILATION_ERROR:
            return "Compilation Error.";
        case status::SYSTEM_ERROR:
            return "System Error. Please try again later.";
        case status::CANCELLED:
            return fmt::format("Cancelled. Passed {}/{} test cases before cancellation.", result.passed_tests, result.total_tests);
        default:
            return get_display_message(result.result);
    }
}

static test_case_result make_result(const test_case &tc, status stat) {
    test_case_result r;
    r.test_case_id = tc.id;
    r.result = stat;
    r.is_hidden = tc.is_hidden;
    r.input = tc.input_data;
    r.expected_output = tc.expected_output;
    return r;
}

test_case_result judger::judge_test_case(const submission_context &context, const test_case &tc, const string &input,
                                         double time_limit, const comparator_options &options, const cancellation_token &cancel) const {
    test_case_result r = make_result(tc, status::RUNNING);
    execution_result exec = box.execute(context.program, input, time_limit, cancel);
    r.duration = exec.wall_time;
    r.actual_output = exec.output;

    if (exec.cancelled) {
        r.result = status::CANCELLED;
    } else if (exec.timed_out) {
        r.result = status::TIME_LIMIT_EXCEEDED;
        r.error_message = fmt::format("Time limit exceeded ({}s)", time_limit);
    } else if (exec.signal != 0) {
        r.result = status::RUNTIME_ERROR;
        r.error_message = exec.error.empty() ? fmt::format("Killed by signal {} ({})", exec.signal, strsignal(exec.signal)) : exec.error;
    } else if (exec.exitcode != 0) {
        r.result = status::RUNTIME_ERROR;
        r.error_message = exec.error.empty() ? fmt::format("Exited with code {}", exec.exitcode) : exec.error;
    } else if (equivalent(exec.output, tc.expected_output, options)) {
        r.result = status::ACCEPTED;
        r.passed = true;
    } else {
        r.result = status::WRONG_ANSWER;
    }
    return r;
}

submission_result judger::evaluate(const evaluation_request &request, const cancellation_token &cancel) const {
    // 调用方的错误在编译之前就抛出，不会作为评测结果返回
    box.languages().at(request.language);

    vector<const test_case *> tests;
    for (auto &tc : request.test_cases)
        if (request.mode == evaluation_mode::SUBMIT || !tc.is_hidden)
            tests.push_back(&tc);
    if (tests.empty())
        throw malformed_input_error(fmt::format("No test cases to evaluate in {} mode", get_mode_name(request.mode)));

    vector<string> inputs;
    for (auto tc : tests) inputs.push_back(to_stdin(request.parameters, tc->input_data));

    double time_limit = request.time_limit > 0 ? request.time_limit : DEFAULT_TIME_LIMIT;
    comparator_options options;
    options.boolean_result = request.return_type == semantic_type::BOOL;

    submission_result result;
    result.result = status::RUNNING;
    size_t next = 0;  // 下一个要运行的测试点
    bool cancelled = false;
    status worst = status::ACCEPTED;

    try {
        submission_context context;
        try {
            context.program = box.compile(request.language, request.source, context.dir, 0, cancel);
        } catch (compilation_error &e) {
            result.result = status::COMPILATION_ERROR;
            result.compile_log = e.error_log;
            result.message = summary_message(result);
            return result;
        }

        for (; next < tests.size(); ++next) {
            if (cancel.cancelled()) {
                cancelled = true;
                break;
            }

            test_case_result r = judge_test_case(context, *tests[next], inputs[next], time_limit, options, cancel);
            result.results.push_back(r);
            if (r.result == status::CANCELLED) {
                cancelled = true;
                ++next;
                break;
            }

            ++result.total_tests;
            result.total_duration += r.duration;
            if (r.passed) {
                ++result.passed_tests;
            } else {
                if (severity(r.result) > severity(worst)) worst = r.result;
                if (request.mode == evaluation_mode::SUBMIT) break;
            }
        }
    } catch (evaluation_cancelled &) {
        cancelled = true;
    } catch (judge_exception &ex) {
        LOG(ERROR) << "Evaluation failed with internal error: " << ex.what() << endl
                   << ex;
        result.result = status::SYSTEM_ERROR;
        result.message = summary_message(result);
        return result;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Evaluation failed with internal error: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        result.result = status::SYSTEM_ERROR;
        result.message = summary_message(result);
        return result;
    }

    if (cancelled) {
        for (; next < tests.size(); ++next)
            result.results.push_back(make_result(*tests[next], status::NOT_ATTEMPTED));
        result.result = status::CANCELLED;
    } else {
        result.result = worst;
    }
    result.message = summary_message(result);
    return result;
}

submission_result judger::evaluate(const string &language, const string &source,
                                   const vector<test_case> &test_cases, evaluation_mode mode, double time_limit) const {
    evaluation_request request;
    request.language = language;
    request.source = source;
    request.test_cases = test_cases;
    request.mode = mode;
    request.time_limit = time_limit;
    return evaluate(request);
}

}  // namespace codejudge
