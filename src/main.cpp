#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <thread>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluation/evaluation_service.hpp"
#include "rpc/mq_transport.hpp"
#include "sandbox/sandbox.hpp"
#include "store/filesystem_backend.hpp"
#include "store/object_store.hpp"
#include "worker.hpp"
using namespace std;

static volatile sig_atomic_t exit_requested = 0;

void sigintHandler(int /* signum */) {
    exit_requested = 1;
}

/**
 * @brief 阻塞直到收到 SIGINT 或 SIGTERM
 */
static void wait_for_exit() {
    while (!exit_requested)
        this_thread::sleep_for(chrono::milliseconds(200));
    LOG(ERROR) << "Received signal, stopping services";
}

static filesystem::path option_or_env(const boost::program_options::variables_map& vm, const char* option, const char* env,
                                      const filesystem::path& def) {
    if (vm.count(option)) return filesystem::path(vm.at(option).as<string>());
    return filesystem::path(get_env(env, def.string()));
}

static unique_ptr<grader::store::object_store> open_object_store() {
    CHECK(!grader::STORE_DIR.empty())
        << "Object store directory should be specified by --store-dir or STOREDIR";
    auto durable = make_unique<grader::store::filesystem_backend>(grader::STORE_DIR);
    unique_ptr<grader::store::backend> cache;
    if (!grader::CACHE_DIR.empty())
        cache = make_unique<grader::store::filesystem_backend>(grader::CACHE_DIR);
    return make_unique<grader::store::object_store>(move(durable), move(cache));
}

static int run_evaluation(const nlohmann::json& config) {
    auto amqp = nlohmann::get_value<grader::rpc::amqp>(config, "amqp");
    auto redis = nlohmann::get_value<grader::rpc::redis>(config, "redis");
    auto evaluation = nlohmann::get_value_def<grader::evaluation_config>(config, grader::evaluation_config(), "evaluation");

    grader::memory_store contest;
    contest.load(nlohmann::get_value<nlohmann::json>(config, "contest"));

    auto objects = open_object_store();
    grader::rpc::mq_transport transport(amqp, redis);
    grader::rpc::client client(transport);
    grader::evaluation_service service(evaluation, contest, client, objects.get());
    service.register_monitor(make_unique<grader::log_monitor>());

    grader::rpc::mq_server server(amqp, redis);
    server.serve(0, service.admin_service());

    service.start();
    wait_for_exit();
    server.stop();
    service.stop();
    return EXIT_SUCCESS;
}

static int run_worker(const nlohmann::json& config, int shard, size_t concurrency, const string& sandbox_type) {
    auto amqp = nlohmann::get_value<grader::rpc::amqp>(config, "amqp");
    auto redis = nlohmann::get_value<grader::rpc::redis>(config, "redis");

    unique_ptr<grader::sandbox> box;
    if (sandbox_type == "runguard") {
        box = make_unique<grader::runguard_sandbox>(grader::RUNGUARD);
    } else if (sandbox_type == "process") {
        box = make_unique<grader::process_sandbox>();
    } else {
        LOG(FATAL) << "Unrecognized sandbox type " << sandbox_type;
    }

    auto objects = open_object_store();
    grader::worker w(shard, *objects, *box, concurrency);

    grader::rpc::mq_server server(amqp, redis);
    server.serve(shard, w.rpc_service(), concurrency + 1);
    LOG(INFO) << "Worker " << shard << " started with " << concurrency << " slots";

    wait_for_exit();
    server.stop();
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("service", po::value<string>()->required(), "the service to run, either evaluation or worker")
        ("shard", po::value<int>()->default_value(0), "the shard of the worker")
        ("config", po::value<string>()->required(), "the configuration file with amqp, redis, evaluation and contest sections")
        ("store-dir", po::value<string>(), "set the directory of the object store. You can either pass it from environ STOREDIR")
        ("cache-dir", po::value<string>(), "set the directory of the local object cache. You can either pass it from environ CACHEDIR")
        ("run-dir", po::value<string>(), "set the directory to create sandboxes in. You can either pass it from environ RUNDIR")
        ("runguard", po::value<string>(), "set the location of runguard. You can either pass it from environ RUNGUARD")
        ("sandbox", po::value<string>()->default_value("runguard"), "the sandbox of the worker, either runguard or process")
        ("concurrency", po::value<size_t>()->default_value(1), "the number of operations the worker runs at the same time")
        ("debug", "turn on the debug mode not to delete sandbox directories to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        if (vm.count("help")) {
            cout << "Grader: evaluate contest submissions on a pool of workers" << endl
                 << "Usage: " << argv[0] << " --service evaluation|worker --config <file> [options]" << endl;
            cout << desc << endl;
            return EXIT_SUCCESS;
        }
        if (vm.count("version")) {
            cout << "grader 1.0" << endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("debug") || !get_env("DEBUG", "").empty()) grader::DEBUG = true;

    grader::STORE_DIR = option_or_env(vm, "store-dir", "STOREDIR", grader::STORE_DIR);
    grader::CACHE_DIR = option_or_env(vm, "cache-dir", "CACHEDIR", grader::CACHE_DIR);
    grader::RUN_DIR = option_or_env(vm, "run-dir", "RUNDIR", grader::RUN_DIR);
    grader::RUNGUARD = option_or_env(vm, "runguard", "RUNGUARD", grader::RUNGUARD);

    if (!grader::STORE_DIR.empty()) filesystem::create_directories(grader::STORE_DIR);
    if (!grader::CACHE_DIR.empty()) filesystem::create_directories(grader::CACHE_DIR);
    filesystem::create_directories(grader::RUN_DIR);
    CHECK(filesystem::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    filesystem::path config_file(vm["config"].as<string>());
    CHECK(filesystem::is_regular_file(config_file))
        << "Configuration file " << config_file << " does not exist";

    try {
        nlohmann::json config = nlohmann::json::parse(grader::read_file_content(config_file));
        string service = vm["service"].as<string>();
        if (service == "evaluation") {
            return run_evaluation(config);
        } else if (service == "worker") {
            return run_worker(config, vm["shard"].as<int>(), vm["concurrency"].as<size_t>(), vm["sandbox"].as<string>());
        } else {
            LOG(FATAL) << "Unrecognized service " << service;
        }
    } catch (std::exception& e) {
        LOG(FATAL) << "Service crashed: " << boost::diagnostic_information(e);
    }
    return EXIT_FAILURE;
}
