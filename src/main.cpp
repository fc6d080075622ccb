#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/execution.hpp"
#include "judge/piston.hpp"
#include "server/config.hpp"
#include "server/contest_service.hpp"
#include "server/memory_repository.hpp"
#include "server/mysql_repository.hpp"
#include "server/serialization.hpp"
using namespace std;

// 退出码
static const int EXIT_REJECTED = 2;
static const int EXIT_DATABASE = 3;

struct curl_global_guard {
    curl_global_guard() { curl_global_init(CURL_GLOBAL_ALL); }
    ~curl_global_guard() { curl_global_cleanup(); }
};

static string required(const boost::program_options::variables_map& vm, const char* key) {
    if (!vm.count(key))
        throw invalid_argument(string("Option --") + key + " is required by this command");
    return vm.at(key).as<string>();
}

static string read_code(const boost::program_options::variables_map& vm) {
    if (vm.count("code-file"))
        return ladder::read_file_content(vm.at("code-file").as<string>());
    return ladder::read_stdin_content();
}

static nlohmann::json dispatch(const string& command, ladder::server::contest_service& service,
                               ladder::sandbox& sb,
                               const string& participant, const boost::program_options::variables_map& vm,
                               bool& modified) {
    using nlohmann::json;
    if (command == "levels") {
        return service.levels(participant);
    } else if (command == "active") {
        auto active = service.active_level(participant);
        if (!active) return nullptr;
        return *active;
    } else if (command == "join") {
        auto result = service.join(participant, required(vm, "exam"), required(vm, "exam-code"));
        modified = !result.already_joined;
        return result;
    } else if (command == "questions") {
        string exam_id;
        if (vm.count("exam")) {
            exam_id = vm.at("exam").as<string>();
        } else {
            auto active = service.active_level(participant);
            if (!active) return json::array();
            exam_id = active->level.id;
        }
        return service.questions(participant, exam_id);
    } else if (command == "question") {
        return service.get_question(participant, required(vm, "question"));
    } else if (command == "run") {
        ladder::server::run_request request;
        request.question_id = required(vm, "question");
        request.language = required(vm, "language");
        request.code = read_code(vm);
        if (vm.count("input-file"))
            request.custom_input = ladder::read_file_content(vm.at("input-file").as<string>());
        if (vm.count("expected-file"))
            request.custom_expected_output = ladder::read_file_content(vm.at("expected-file").as<string>());
        return service.run(participant, request);
    } else if (command == "submit") {
        ladder::server::submit_request request;
        request.question_id = required(vm, "question");
        request.language = required(vm, "language");
        request.code = read_code(vm);
        auto report = service.submit(participant, request);
        modified = true;
        return report;
    } else if (command == "submissions") {
        return service.submissions(participant);
    } else if (command == "runtimes") {
        json result = json::array();
        for (auto& rt : sb.runtimes())
            result.push_back({{"language", rt.language}, {"version", rt.version}, {"aliases", rt.aliases}});
        return result;
    } else {
        throw invalid_argument("Unrecognized command " + command);
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    curl_global_guard curl_guard;

    namespace po = boost::program_options;
    po::options_description desc("ladder-judge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "levels, active, join, questions, question, run, submit, submissions or runtimes")
        ("config", po::value<string>(), "configuration file path. You can either pass it from environ LADDER_CONFIG")
        ("fixture", po::value<string>(), "use the JSON data file instead of the database, joins and submissions are written back")
        ("participant", po::value<string>(), "the participant id to act as")
        ("exam", po::value<string>(), "level id, for join and questions (defaults to the active level)")
        ("exam-code", po::value<string>(), "level code, for join")
        ("question", po::value<string>(), "question id, for question, run and submit")
        ("language", po::value<string>(), "language of the source code, for run and submit")
        ("code-file", po::value<string>(), "source code file, read from stdin if not specified")
        ("input-file", po::value<string>(), "custom input for run, visible testcases are used if not specified")
        ("expected-file", po::value<string>(), "expected output of the custom input for run")
        ("sandbox-url", po::value<string>(), "root url of the Piston API. You can either pass it from environ SANDBOX_URL")
        ("debug", "turn on the debug mode to log sandbox responses")
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
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ladder-judge: judge code of a multi-level coding exam" << endl
             << "Usage: " << argv[0] << " <command> --participant <id> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ladder-judge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        ladder::DEBUG = true;
    } else if (getenv("DEBUG")) {
        ladder::DEBUG = true;
    }

    ladder::server::application_config config;
    string config_path = vm.count("config") ? vm.at("config").as<string>() : ladder::get_env("LADDER_CONFIG", "");
    if (!config_path.empty()) {
        CHECK(filesystem::is_regular_file(config_path))
            << "Configuration file " << config_path << " does not exist";
        try {
            nlohmann::json::parse(ladder::read_file_content(config_path)).get_to(config);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_path << " is malformed: " << e.what();
        }
    }

    if (vm.count("sandbox-url")) {
        config.sandbox.url = vm.at("sandbox-url").as<string>();
    } else if (getenv("SANDBOX_URL")) {
        config.sandbox.url = getenv("SANDBOX_URL");
    }

    if (vm.count("fixture")) {
        config.fixture = vm.at("fixture").as<string>();
        config.database.reset();
    }

    CHECK(vm.count("command")) << "No command specified, see --help";
    CHECK(config.database || !config.fixture.empty())
        << "Neither database nor fixture is configured";

    string command = vm.at("command").as<string>();
    string participant = vm.count("participant") ? vm.at("participant").as<string>() : "";
    if (participant.empty() && command != "runtimes") {
        cerr << "Option --participant is required" << endl;
        return EXIT_FAILURE;
    }

    try {
        unique_ptr<ladder::server::repository> repo;
        ladder::server::memory_repository* fixture_repo = nullptr;
        if (config.database) {
            repo = make_unique<ladder::server::mysql_repository>(*config.database);
        } else {
            auto loaded = ladder::server::memory_repository::load(config.fixture);
            fixture_repo = loaded.get();
            repo = move(loaded);
        }

        ladder::piston_sandbox sb(config.sandbox.url, chrono::milliseconds(config.sandbox.request_slack));
        ladder::execution_client client(sb, config.sandbox);
        ladder::server::contest_service service(*repo, client, config.sandbox.max_concurrency);

        bool modified = false;
        nlohmann::json result = dispatch(command, service, sb, participant, vm, modified);
        if (modified && fixture_repo)
            fixture_repo->save(config.fixture);

        cout << result.dump(2) << endl;
        return EXIT_SUCCESS;
    } catch (ladder::request_error& e) {
        LOG(WARNING) << "Request rejected: " << e.what();
        cout << nlohmann::json{{"error", e.what()}}.dump(2) << endl;
        return EXIT_REJECTED;
    } catch (ladder::unsupported_language& e) {
        LOG(WARNING) << "Request rejected: " << e.what();
        cout << nlohmann::json{{"error", e.what()}, {"supportedLanguages", e.supported}}.dump(2) << endl;
        return EXIT_REJECTED;
    } catch (ladder::database_error& e) {
        LOG(ERROR) << "Database failure: " << e;
        cout << nlohmann::json{{"error", e.what()}}.dump(2) << endl;
        return EXIT_DATABASE;
    } catch (ladder::judge_exception& e) {
        LOG(ERROR) << "Unable to execute " << command << ": " << e;
        cout << nlohmann::json{{"error", e.what()}}.dump(2) << endl;
        return EXIT_FAILURE;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to execute " << command << ": " << e.what();
        cout << nlohmann::json{{"error", e.what()}}.dump(2) << endl;
        return EXIT_FAILURE;
    }
}
