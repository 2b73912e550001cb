#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "codejudge/judge/judger.hpp"
#include "codejudge/server/problem_repository.hpp"
#include "codejudge/template/generator.hpp"
#include "codejudge/worker.hpp"

namespace codejudge {

/**
 * @brief 评测服务，对外提供代码模板生成和评测
 *
 * 持有模板生成器、执行沙箱、评测编排和 worker 线程池。
 * 同步接口在调用线程中评测，异步接口将评测放到 worker 线程池中执行，
 * 两者共享同一个 sandbox，因此同时运行的子进程数量始终受 MAX_PROCESSES 限制。
 */
struct judge_service {
    /**
     * @param languages 语言表
     * @param repository 题目仓库，不需要按题目评测时可以为 nullptr
     * @param workers worker 线程的数量
     */
    judge_service(language_registry languages, std::unique_ptr<problem_repository> repository, std::size_t workers);

    /**
     * @brief 生成代码模板，相同的函数声明和语言只生成一次
     * @throw unsupported_language_error
     * @throw unsupported_type_error
     * @throw malformed_input_error
     */
    std::string generate_template(const function_spec &spec, const std::string &language);

    /**
     * @brief 生成题目的代码模板
     * @throw problem_not_found_error
     */
    std::string generate_problem_template(const std::string &problem_id, const std::string &language);

    /**
     * @brief 在当前线程评测一个提交
     * @see judger::evaluate
     */
    submission_result evaluate(const evaluation_request &request, const cancellation_token &cancel = {});

    /**
     * @brief 将提交交给 worker 线程池评测
     * 调用方的错误（如语言不支持、测试数据格式错误）通过 future 抛出
     */
    std::future<submission_result> evaluate_async(evaluation_request request, cancellation_token cancel = {});

    /**
     * @brief 评测题目仓库中的题目
     * 运行模式只读取公开的测试点，提交模式读取所有测试点
     * @throw problem_not_found_error
     */
    submission_result judge_problem(const std::string &problem_id, const std::string &language, const std::string &source,
                                    evaluation_mode mode, double time_limit, const cancellation_token &cancel = {});

    const template_generator &generator() const;

    sandbox &get_sandbox();

private:
    problem_repository &get_repository();

    template_generator templates;
    sandbox box;
    judger judge;
    std::unique_ptr<problem_repository> repository;

    std::mutex cache_mutex;
    std::map<std::pair<std::string, std::string>, std::string> template_cache;

    // 声明在最后因此最先析构，worker 线程退出之前上面的成员仍然有效
    worker_pool pool;
};

}  // namespace codejudge
