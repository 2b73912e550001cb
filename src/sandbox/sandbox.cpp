#include "codejudge/sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <regex>
#include "codejudge/common/defer.hpp"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/config.hpp"

namespace codejudge {
using namespace std;

process_limiter::process_limiter(size_t max_processes)
    : available(max(max_processes, (size_t)1)) {}

void process_limiter::acquire() {
    unique_lock<mutex> lock(mut);
    cond.wait(lock, [this] { return available > 0; });
    --available;
}

void process_limiter::release() {
    {
        lock_guard<mutex> lock(mut);
        ++available;
    }
    cond.notify_one();
}

sandbox::sandbox(language_registry languages)
    : sandbox(move(languages), MAX_PROCESSES) {}

sandbox::sandbox(language_registry languages, size_t max_processes)
    : registry(move(languages)), limiter(max_processes) {}

const language_registry &sandbox::languages() const {
    return registry;
}

static string find_class_name(const language_config &config, const string &source) {
    regex pattern;
    try {
        pattern = regex(config.class_pattern);
    } catch (regex_error &e) {
        throw internal_error(fmt::format("Invalid class pattern of language {}: {}", config.name, e.what()));
    }
    smatch match;
    if (!regex_search(source, match, pattern) || match.size() < 2)
        throw compilation_error("Unable to find class name", "No public class found in the source code");
    return match[1].str();
}

artifact sandbox::compile(const string &language, const string &source, const workspace &ws, double time_limit, const cancellation_token &cancel) {
    const language_config &config = registry.at(language);

    artifact program;
    program.language = language;
    program.compile_dir = ws.path() / "compile";
    error_code ec;
    filesystem::create_directories(program.compile_dir, ec);
    if (ec)
        throw internal_error("Unable to create directory " + program.compile_dir.string() + ": " + ec.message());

    map<string, string> variables = {{"compile_dir", program.compile_dir.string()}};
    if (!config.class_pattern.empty())
        variables["class"] = assert_safe_path(find_class_name(config, source));
    string source_file = assert_safe_path(expand_command({config.source_file}, variables)[0]);
    variables["source"] = source_file;

    write_file_content(program.compile_dir / source_file, source);
    program.run_command = expand_command(config.run_command, variables);

    if (config.compile_command.empty()) return program;

    process_options options;
    options.command = expand_command(config.compile_command, variables);
    options.workdir = program.compile_dir;
    options.time_limit = time_limit > 0 ? time_limit : config.compile_time_limit > 0 ? config.compile_time_limit : COMPILE_TIME_LIMIT;
    options.cancel = cancel;

    execution_result result = launch(options);
    program.compile_log = result.output + result.error;
    if (result.cancelled)
        throw evaluation_cancelled("Compilation cancelled");
    if (result.timed_out)
        throw compilation_error("Compilation time limit exceeded",
                                program.compile_log + fmt::format("\nCompilation time limit exceeded ({}s)", options.time_limit));
    if (!result.succeeded()) {
        DLOG(INFO) << "Compilation of " << language << " failed with exitcode " << result.exitcode;
        throw compilation_error("Compilation error", program.compile_log);
    }
    return program;
}

execution_result sandbox::execute(const artifact &program, const string &input, double time_limit, const cancellation_token &cancel) {
    // 每次运行都在编译目录旁边创建新的运行目录，选手程序写入的文件不会影响下一个测试点
    workspace run_dir(program.compile_dir.parent_path());

    process_options options;
    options.command = program.run_command;
    options.workdir = run_dir.path();
    options.input = input;
    options.time_limit = time_limit;
    options.cancel = cancel;
    return launch(options);
}

execution_result sandbox::run(const string &language, const string &source, const string &input, double time_limit) {
    workspace ws;
    artifact program = compile(language, source, ws);
    return execute(program, input, time_limit);
}

execution_result sandbox::launch(const process_options &options) {
    limiter.acquire();
    defer { limiter.release(); };
    return run_process(options);
}

}  // namespace codejudge
