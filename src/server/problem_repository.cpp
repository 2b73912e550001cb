#include "codejudge/server/problem_repository.hpp"
#include <glog/logging.h>
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/json_utils.hpp"

namespace codejudge {
using namespace std;

problem_not_found_error::problem_not_found_error(const string &problem_id)
    : judge_exception("Problem " + problem_id + " not found") {}

problem_repository::~problem_repository() {}

json_problem_repository::json_problem_repository(const filesystem::path &problem_dir)
    : problem_dir(problem_dir) {}

nlohmann::ordered_json json_problem_repository::load(const string &problem_id) const {
    // 题目编号不能跳出题目目录
    if (problem_id.empty() || problem_id.find('/') != string::npos || problem_id.find("..") != string::npos)
        throw problem_not_found_error(problem_id);
    filesystem::path path = problem_dir / (problem_id + ".json");
    if (!filesystem::is_regular_file(path))
        throw problem_not_found_error(problem_id);
    try {
        return nlohmann::ordered_json::parse(read_file_content(path));
    } catch (nlohmann::json::parse_error &e) {
        throw malformed_input_error("Problem " + problem_id + " is not valid JSON: " + e.what());
    }
}

function_spec json_problem_repository::get_function_spec(const string &problem_id) {
    auto problem = load(problem_id);
    return parse_function_spec(access(problem, "function"));
}

vector<test_case> json_problem_repository::get_test_cases(const string &problem_id, bool include_hidden) {
    auto problem = load(problem_id);
    auto &cases = access(problem, "test_cases");
    if (!cases.is_array())
        throw build_malformed_input(problem, "test_cases");

    vector<test_case> result;
    size_t index = 0;
    for (auto &item : cases) {
        test_case tc = parse_test_case(item, index++);
        if (include_hidden || !tc.is_hidden)
            result.push_back(move(tc));
    }
    DLOG(INFO) << "Loaded " << result.size() << " test cases of problem " << problem_id;
    return result;
}

}  // namespace codejudge
