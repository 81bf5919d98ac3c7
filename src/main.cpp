#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>
#include "cache/memory_cache.hpp"
#include "cache/redis_cache.hpp"
#include "cache/result_cache.hpp"
#include "client/execution_client.hpp"
#include "client/http_sandbox.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "monitor/log_monitor.hpp"
#include "server/grading_service.hpp"
#include "store/memory_store.hpp"
#include "store/mysql_store.hpp"
using namespace std;

static atomic<bool> interrupted{false};

void sigintHandler(int /* signum */) {
    interrupted = true;
}

/**
 * @brief 把目录中的题目导入题目仓库
 * 每个 .json 文件是一道题目的一个版本，已经存在的版本会被跳过
 */
static size_t import_challenges(grader::store::challenge_store &store, const filesystem::path &dir) {
    size_t count = 0;
    for (const auto &p : filesystem::directory_iterator(dir)) {
        const auto &path = p.path();
        if (!filesystem::is_regular_file(path) || path.extension() != ".json") continue;

        grader::challenge c;
        try {
            nlohmann::json::parse(grader::read_file_content(path)).get_to(c);
        } catch (std::exception &e) {
            LOG(FATAL) << "Challenge file " << path << " is malformed: " << e.what();
        }

        if (store.latest_version(c.id).value_or(0) >= c.version) {
            DLOG(INFO) << c << " has already been imported";
            continue;
        }
        store.put_challenge(c);
        LOG(INFO) << "Imported " << c << " with " << c.test_cases.size() << " test cases";
        ++count;
    }
    return count;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("challenge-grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ GRADER_CONFIG")
        ("challenges", po::value<string>(), "import challenge versions from .json files in given directory before grading. You can either pass it from environ GRADER_CHALLENGES")
        ("workers", po::value<unsigned>(), "override the number of grading workers")
        ("poll", "poll the submission store for pending submissions created by other processes")
        ("debug", "turn on the debug mode to log the details of each grading.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "ChallengeGrader: Grade challenge submissions in remote sandboxes" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "challenge-grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        grader::DEBUG = true;
    } else if (getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    string config_path;
    if (vm.count("config")) {
        config_path = vm.at("config").as<string>();
    } else {
        config_path = grader::get_env("GRADER_CONFIG", "");
    }
    CHECK(!config_path.empty())
        << "Configuration file should be specified by --config or GRADER_CONFIG";
    CHECK(filesystem::is_regular_file(config_path))
        << "Configuration file " << config_path << " does not exist";

    grader::configuration config;
    try {
        config = grader::load_configuration(config_path);
    } catch (std::exception &e) {
        LOG(FATAL) << e.what();
    }

    if (vm.count("workers")) {
        config.grading.workers = vm["workers"].as<unsigned>();
        CHECK(config.grading.workers > 0) << "At least one worker is required";
    }

    bool poll = vm.count("poll") > 0;
    if (poll && config.grading.poll_interval.count() == 0)
        config.grading.poll_interval = chrono::seconds(1);

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";

    shared_ptr<grader::store::challenge_store> challenges;
    shared_ptr<grader::store::submission_store> submissions;
    try {
        if (config.store == "mysql") {
            auto store = make_shared<grader::store::mysql_store>(config.database);
            challenges = store;
            submissions = store;
        } else {
            auto store = make_shared<grader::store::memory_store>();
            challenges = store;
            submissions = store;
        }
    } catch (grader::infrastructure_error &e) {
        LOG(FATAL) << "Unable to open the " << config.store << " store: " << e.what() << endl
                   << boost::diagnostic_information(e);
    }

    string challenges_dir;
    if (vm.count("challenges")) {
        challenges_dir = vm.at("challenges").as<string>();
    } else {
        challenges_dir = grader::get_env("GRADER_CHALLENGES", "");
    }
    if (!challenges_dir.empty()) {
        CHECK(filesystem::is_directory(challenges_dir))
            << "Challenge directory " << challenges_dir << " does not exist";
        try {
            size_t count = import_challenges(*challenges, challenges_dir);
            LOG(INFO) << "Imported " << count << " challenge versions from " << challenges_dir;
        } catch (grader::grader_exception &e) {
            LOG(FATAL) << "Unable to import challenges: " << e.what() << endl
                       << boost::diagnostic_information(e);
        }
    }

    shared_ptr<grader::cache::cache_backend> backend;
    if (config.cache.backend == "redis") {
        backend = make_shared<grader::cache::redis_cache>(config.redis, config.cache.prefix);
    } else {
        backend = make_shared<grader::cache::memory_cache>(config.cache.capacity);
    }
    grader::cache::result_cache cache(backend, config.cache.ttl);

    auto sandbox = make_shared<grader::client::http_sandbox>(config.sandbox.url);
    grader::client::execution_client executor(sandbox, config.sandbox);

    grader::monitor_group monitors;
    monitors.register_monitor(make_unique<grader::log_monitor>());

    grader::grading_orchestrator orchestrator(*challenges, *submissions, cache, executor, monitors, config.grading);
    grader::server::grading_service service(*challenges, *submissions, orchestrator, executor, monitors, config.grading);

    try {
        service.resume();
    } catch (grader::infrastructure_error &e) {
        LOG(ERROR) << "Unable to resume pending submissions: " << e.what();
    }
    service.start(poll);

    while (!interrupted)
        this_thread::sleep_for(chrono::milliseconds(200));

    LOG(ERROR) << "Received SIGINT, stopping workers";
    service.stop();

    curl_global_cleanup();
    return 0;
}
