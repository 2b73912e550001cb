#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "codejudge/common/cancellation.hpp"
#include "codejudge/common/exceptions.hpp"
#include "codejudge/common/io_utils.hpp"
#include "codejudge/common/utils.hpp"
#include "codejudge/config.hpp"
#include "codejudge/server/judge_service.hpp"
using namespace std;

static codejudge::cancellation_token cancel_token;

void sigintHandler(int /* signum */) {
    cancel_token.cancel();
}

static nlohmann::ordered_json read_json_file(const string &path) {
    CHECK(filesystem::is_regular_file(path))
        << "File " << path << " does not exist";
    return nlohmann::ordered_json::parse(codejudge::read_file_content(path));
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "template: generate the code template of a function; run: judge public test cases; submit: judge all test cases")
        ("language", po::value<string>(), "language of the template or the source code, such as cpp, c, java, python, javascript")
        ("source", po::value<string>(), "path to the source code to be judged")
        ("problem", po::value<string>(), "id of the problem in problem directory")
        ("problem-dir", po::value<string>(), "set the directory containing <problem>.json files. You can either pass it from environ PROBLEMDIR")
        ("spec", po::value<string>(), "path to the function spec in JSON, instead of --problem")
        ("tests", po::value<string>(), "path to the test cases in JSON array, instead of --problem")
        ("time-limit", po::value<double>(), "set time limit in seconds for each test case, default to 5. You can either pass it from environ TIMELIMIT")
        ("run-dir", po::value<string>(), "set the directory to compile and run user programs. You can either pass it from environ RUNDIR")
        ("languages", po::value<string>(), "load language configurations from JSON file, overriding builtin ones. You can either pass it from environ LANGUAGES")
        ("workers", po::value<size_t>(), "set the number of workers judging submissions concurrently. You can either pass it from environ WORKERS")
        ("max-processes", po::value<size_t>(), "set the maximum number of child processes running at the same time. You can either pass it from environ MAXPROCESSES")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of stdout and stderr kept for each run, default to 67108864(64MB). You can either pass it from environ OUTPUTLIMIT")
        ("debug", "turn on the debug mode to keep the submission directories for checking compiled programs.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("help") || !vm.count("command")) {
        cout << "codejudge: generate code templates, run and judge function-style submissions" << endl
             << "Usage: " << argv[0] << " template|run|submit [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("debug")) {
        codejudge::DEBUG = true;
    } else if (getenv("DEBUG")) {
        codejudge::DEBUG = true;
    }

    if (vm.count("run-dir")) {
        codejudge::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        codejudge::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(codejudge::RUN_DIR);
    CHECK(filesystem::is_directory(codejudge::RUN_DIR))
        << "Run directory " << codejudge::RUN_DIR << " does not exist";

    if (vm.count("time-limit")) {
        codejudge::DEFAULT_TIME_LIMIT = vm["time-limit"].as<double>();
    } else if (getenv("TIMELIMIT")) {
        codejudge::DEFAULT_TIME_LIMIT = boost::lexical_cast<double>(getenv("TIMELIMIT"));
    }
    CHECK(codejudge::DEFAULT_TIME_LIMIT > 0) << "Time limit should be positive";

    if (vm.count("workers")) {
        codejudge::WORKERS = vm["workers"].as<size_t>();
    } else if (getenv("WORKERS")) {
        codejudge::WORKERS = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }

    if (vm.count("max-processes")) {
        codejudge::MAX_PROCESSES = vm["max-processes"].as<size_t>();
    } else if (getenv("MAXPROCESSES")) {
        codejudge::MAX_PROCESSES = boost::lexical_cast<size_t>(getenv("MAXPROCESSES"));
    }
    CHECK(codejudge::MAX_PROCESSES > 0) << "Max processes should be positive";

    if (vm.count("output-limit")) {
        codejudge::OUTPUT_LIMIT = vm["output-limit"].as<size_t>();
    } else if (getenv("OUTPUTLIMIT")) {
        codejudge::OUTPUT_LIMIT = boost::lexical_cast<size_t>(getenv("OUTPUTLIMIT"));
    }

    codejudge::language_registry languages = codejudge::language_registry::default_languages();
    string languages_file = vm.count("languages") ? vm["languages"].as<string>() : codejudge::get_env("LANGUAGES", "");
    if (!languages_file.empty()) {
        CHECK(filesystem::is_regular_file(languages_file))
            << "Language configuration " << languages_file << " does not exist";
        languages.load(nlohmann::json::parse(codejudge::read_file_content(languages_file)));
    }

    unique_ptr<codejudge::problem_repository> repository;
    string problem_dir = vm.count("problem-dir") ? vm["problem-dir"].as<string>() : codejudge::get_env("PROBLEMDIR", "");
    if (!problem_dir.empty()) {
        CHECK(filesystem::is_directory(problem_dir))
            << "Problem directory " << problem_dir << " does not exist";
        repository = make_unique<codejudge::json_problem_repository>(problem_dir);
    }

    signal(SIGINT, sigintHandler);

    try {
        codejudge::judge_service service(move(languages), move(repository), codejudge::WORKERS);
        string command = vm["command"].as<string>();
        CHECK(vm.count("language")) << "--language should be specified";
        string language = vm["language"].as<string>();

        if (command == "template") {
            if (vm.count("problem")) {
                cout << service.generate_problem_template(vm["problem"].as<string>(), language);
            } else {
                CHECK(vm.count("spec")) << "Either --problem or --spec should be specified";
                cout << service.generate_template(codejudge::parse_function_spec(read_json_file(vm["spec"].as<string>())), language);
            }
            return EXIT_SUCCESS;
        }

        codejudge::evaluation_mode mode = codejudge::parse_evaluation_mode(command);
        CHECK(vm.count("source")) << "--source should be specified";
        CHECK(filesystem::is_regular_file(vm["source"].as<string>()))
            << "Source file " << vm["source"].as<string>() << " does not exist";
        string source = codejudge::read_file_content(vm["source"].as<string>());

        codejudge::submission_result result;
        if (vm.count("problem")) {
            result = service.judge_problem(vm["problem"].as<string>(), language, source, mode, codejudge::DEFAULT_TIME_LIMIT, cancel_token);
        } else {
            CHECK(vm.count("tests")) << "Either --problem or --tests should be specified";
            codejudge::evaluation_request request;
            request.language = language;
            request.source = source;
            request.mode = mode;
            request.time_limit = codejudge::DEFAULT_TIME_LIMIT;
            auto tests = read_json_file(vm["tests"].as<string>());
            CHECK(tests.is_array()) << "Test cases should be a JSON array";
            for (size_t i = 0; i < tests.size(); ++i)
                request.test_cases.push_back(codejudge::parse_test_case(tests[i], i));
            if (vm.count("spec")) {
                auto spec = codejudge::parse_function_spec(read_json_file(vm["spec"].as<string>()));
                request.parameters = spec.parameters;
                request.return_type = spec.return_type;
            }
            result = service.evaluate(request, cancel_token);
        }

        cout << codejudge::to_json(result).dump(4) << endl;
        return codejudge::is_verdict(result.result) ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (codejudge::judge_exception &ex) {
        cerr << ex.what() << endl;
        LOG(ERROR) << ex;
        return EXIT_FAILURE;
    } catch (std::exception &ex) {
        cerr << ex.what() << endl;
        LOG(ERROR) << boost::diagnostic_information(ex);
        return EXIT_FAILURE;
    }
}
