#include "codejudge/server/judge_service.hpp"
#include <glog/logging.h>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

judge_service::judge_service(language_registry languages, unique_ptr<problem_repository> repository, size_t workers)
    : box(move(languages)), judge(box), repository(move(repository)), pool(workers) {
    register_builtin_templates(templates);
}

string judge_service::generate_template(const function_spec &spec, const string &language) {
    auto key = make_pair(language, to_json(spec).dump());
    {
        scoped_lock guard(cache_mutex);
        auto it = template_cache.find(key);
        if (it != template_cache.end()) return it->second;
    }

    string code = templates.generate(spec, language);

    scoped_lock guard(cache_mutex);
    template_cache.emplace(key, code);
    return code;
}

string judge_service::generate_problem_template(const string &problem_id, const string &language) {
    return generate_template(get_repository().get_function_spec(problem_id), language);
}

submission_result judge_service::evaluate(const evaluation_request &request, const cancellation_token &cancel) {
    LOG(INFO) << "Evaluating " << request.language << " submission with " << request.test_cases.size()
              << " test cases in " << get_mode_name(request.mode) << " mode";
    submission_result result = judge.evaluate(request, cancel);
    LOG(INFO) << "Evaluation finished: " << result.message;
    return result;
}

future<submission_result> judge_service::evaluate_async(evaluation_request request, cancellation_token cancel) {
    auto task = make_shared<packaged_task<submission_result()>>(
        [this, request = move(request), cancel] { return evaluate(request, cancel); });
    future<submission_result> result = task->get_future();
    pool.submit([task] { (*task)(); });
    return result;
}

submission_result judge_service::judge_problem(const string &problem_id, const string &language, const string &source,
                                               evaluation_mode mode, double time_limit, const cancellation_token &cancel) {
    auto &repo = get_repository();
    function_spec spec = repo.get_function_spec(problem_id);

    evaluation_request request;
    request.language = language;
    request.source = source;
    request.test_cases = repo.get_test_cases(problem_id, mode == evaluation_mode::SUBMIT);
    request.mode = mode;
    request.time_limit = time_limit;
    request.parameters = spec.parameters;
    request.return_type = spec.return_type;
    return evaluate(request, cancel);
}

const template_generator &judge_service::generator() const {
    return templates;
}

sandbox &judge_service::get_sandbox() {
    return box;
}

problem_repository &judge_service::get_repository() {
    if (!repository)
        throw internal_error("No problem repository configured");
    return *repository;
}

}  // namespace codejudge
