#include <signal.h>
#include <sys/wait.h>
#include <chrono>
#include <filesystem>
#include <thread>
#include "gtest/gtest.h"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/config.hpp"
#include "codejudge/sandbox/sandbox.hpp"
#include "test/languages.hpp"
using namespace std;
using namespace codejudge;

class SandboxTest : public ::testing::Test {
protected:
    SandboxTest() : box(test_languages(), 2) {}

    sandbox box;
};

TEST_F(SandboxTest, EchoInput) {
    auto result = box.run("sh", "read line\necho \"got $line\"\n", "hello\n", 5);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "got hello\n");
    EXPECT_EQ(result.error, "");
    EXPECT_FALSE(result.timed_out);
}

TEST_F(SandboxTest, LargeInputAndOutput) {
    // 输入输出都超过管道缓冲区的大小
    string input;
    for (int i = 0; i < 100000; ++i) input += "0123456789\n";
    auto result = box.run("sh", "cat\n", input, 10);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, input);
}

TEST_F(SandboxTest, Stderr) {
    auto result = box.run("sh", "echo oops >&2\n", "", 5);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, "oops\n");
}

TEST_F(SandboxTest, ExitCode) {
    auto result = box.run("sh", "exit 3\n", "", 5);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.signal, 0);
}

TEST_F(SandboxTest, KilledBySignal) {
    auto result = box.run("sh", "kill -SEGV $$\n", "", 5);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exitcode, 128 + SIGSEGV);
}

TEST_F(SandboxTest, TimeLimitExceeded) {
    auto start = chrono::steady_clock::now();
    auto result = box.run("sh", "sleep 10\n", "", 0.5);
    auto elapsed = chrono::steady_clock::now() - start;
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    // 进程组中的 sleep 也被杀死，不会等到它结束
    EXPECT_LT(elapsed, chrono::seconds(5));
}

TEST_F(SandboxTest, OutputLimit) {
    process_options options;
    options.command = {"/bin/sh", "-c", "yes | head -c 100000"};
    options.workdir = RUN_DIR;
    options.time_limit = 5;
    options.output_limit = 1000;
    auto result = run_process(options);
    EXPECT_TRUE(result.output_truncated);
    EXPECT_EQ(result.output.size(), 1000);
}

TEST_F(SandboxTest, ChildReapedOnEveryPath) {
    process_options options;
    options.workdir = RUN_DIR;
    options.time_limit = 0.3;
    vector<vector<string>> commands = {
        {"/bin/sh", "-c", "exit 0"},
        {"/bin/sh", "-c", "sleep 10"},
        {"/bin/sh", "-c", "kill -KILL $$"}};
    for (auto &command : commands) {
        options.command = command;
        run_process(options);
        // 子进程已经被回收，没有遗留的僵尸进程
        EXPECT_LE(waitpid(-1, nullptr, WNOHANG), 0) << command.back();
    }

    options.command = {"/nonexistent/program"};
    EXPECT_THROW(run_process(options), internal_error);
    EXPECT_LE(waitpid(-1, nullptr, WNOHANG), 0);
}

TEST_F(SandboxTest, Cancel) {
    cancellation_token cancel;
    thread canceller([cancel] {
        this_thread::sleep_for(chrono::milliseconds(200));
        cancel.cancel();
    });

    workspace ws;
    artifact program = box.compile("sh", "sleep 10\n", ws);
    auto start = chrono::steady_clock::now();
    auto result = box.execute(program, "", 30, cancel);
    auto elapsed = chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(elapsed, chrono::seconds(5));
}

TEST_F(SandboxTest, CompilationError) {
    workspace ws;
    try {
        box.compile("sh", "if then fi (\n", ws);
        FAIL() << "compilation_error expected";
    } catch (compilation_error &e) {
        EXPECT_FALSE(e.error_log.empty());
    }
}

TEST_F(SandboxTest, CancelledCompilation) {
    cancellation_token cancel;
    cancel.cancel();
    workspace ws;
    EXPECT_THROW(box.compile("sh", "echo 1\n", ws, 0, cancel), evaluation_cancelled);
}

TEST_F(SandboxTest, UnsupportedLanguage) {
    EXPECT_THROW(box.run("ruby", "puts 1", "", 5), unsupported_language_error);
}

TEST_F(SandboxTest, ExecutableNotFound) {
    language_config missing;
    missing.name = "missing";
    missing.source_file = "main.txt";
    missing.run_command = {"/nonexistent/interpreter", "{source}"};
    language_registry registry;
    registry.add(missing);
    sandbox missing_box(registry, 1);
    EXPECT_THROW(missing_box.run("missing", "", "", 5), internal_error);
}

TEST_F(SandboxTest, RunsInFreshDirectory) {
    workspace ws;
    artifact program = box.compile("sh", "ls; touch leftover\n", ws);
    auto first = box.execute(program, "", 5);
    auto second = box.execute(program, "", 5);
    EXPECT_EQ(first.output, "");
    EXPECT_EQ(second.output, "");
}

TEST_F(SandboxTest, WorkspaceRemoved) {
    filesystem::path dir;
    {
        workspace ws;
        dir = ws.path();
        EXPECT_TRUE(filesystem::is_directory(dir));
        box.compile("sh", "echo 1\n", ws);
        EXPECT_TRUE(filesystem::exists(dir / "compile" / "main.sh"));
    }
    EXPECT_FALSE(filesystem::exists(dir));
}

TEST_F(SandboxTest, ConcurrentRuns) {
    vector<thread> threads;
    vector<execution_result> results(6);
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] {
            results[i] = box.run("sh", "read n\necho $((n * 2))\n", to_string(i) + "\n", 10);
        });
    for (auto &t : threads) t.join();
    for (size_t i = 0; i < results.size(); ++i)
        EXPECT_EQ(results[i].output, to_string(i * 2) + "\n");
}

TEST(LanguageTest, ExpandCommand) {
    auto command = expand_command({"javac", "{source}", "-d", "{compile_dir}"},
                                  {{"source", "Main.java"}, {"compile_dir", "/tmp/x"}});
    vector<string> expected = {"javac", "Main.java", "-d", "/tmp/x"};
    EXPECT_EQ(command, expected);
}

TEST(LanguageTest, DefaultLanguages) {
    auto registry = language_registry::default_languages();
    vector<string> expected = {"c", "cpp", "java", "javascript", "python"};
    EXPECT_EQ(registry.names(), expected);
    EXPECT_EQ(registry.at("java").source_file, "{class}.java");
    EXPECT_FALSE(registry.at("java").class_pattern.empty());
    EXPECT_THROW(registry.at("ruby"), unsupported_language_error);
}

TEST(LanguageTest, LoadOverrides) {
    auto registry = language_registry::default_languages();
    registry.load(nlohmann::json::parse(R"([
        {"name": "python", "source_file": "solution.py", "run_command": ["pypy3", "{source}"]},
        {"name": "bash", "source_file": "main.sh", "run_command": ["bash", "{source}"], "compile_time_limit": 3}
    ])"));
    EXPECT_EQ(registry.at("python").source_file, "solution.py");
    EXPECT_TRUE(registry.at("python").compile_command.empty());
    EXPECT_TRUE(registry.contains("bash"));
    EXPECT_EQ(registry.at("bash").compile_time_limit, 3);

    auto j = to_json(registry.at("bash"));
    EXPECT_EQ(parse_language_config(j).run_command, registry.at("bash").run_command);
}
