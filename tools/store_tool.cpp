#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "evaluation/submission_store.hpp"
#include "store/filesystem_backend.hpp"
#include "store/maintenance.hpp"
using namespace std;

/**
 * 对象存储的离线维护工具
 *
 *     grader-store --store-dir <dir> verify [--remove]
 *         校验每个对象的内容与文件名是否一致
 *     grader-store --store-dir <dir> gc --contest <file> [--dry-run] [--min-age <seconds>]
 *         删除不被比赛数据引用的对象
 */
int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("grader-store options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>(), "verify or gc")
        ("store-dir", po::value<string>(), "set the directory of the object store. You can either pass it from environ STOREDIR")
        ("contest", po::value<string>(), "the contest data referencing objects, required by gc")
        ("dry-run", "only report orphaned objects without deleting them")
        ("min-age", po::value<long long>()->default_value(3600), "objects younger than this many seconds are never deleted")
        ("remove", "delete corrupted objects found by verify")
        ("help", "display this help text");
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

    if (vm.count("help") || !vm.count("command")) {
        cout << "Usage: " << argv[0] << " verify|gc [options]" << endl;
        cout << desc << endl;
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("store-dir")) {
        grader::STORE_DIR = filesystem::path(vm.at("store-dir").as<string>());
    } else {
        grader::STORE_DIR = filesystem::path(get_env("STOREDIR", grader::STORE_DIR.string()));
    }
    CHECK(filesystem::is_directory(grader::STORE_DIR))
        << "Object store directory " << grader::STORE_DIR << " does not exist";

    grader::store::filesystem_backend objects(grader::STORE_DIR);
    string command = vm["command"].as<string>();

    try {
        if (command == "verify") {
            auto corrupted = grader::store::verify_objects(objects, vm.count("remove"));
            for (auto& digest : corrupted) cout << digest << endl;
            cout << corrupted.size() << " corrupted objects" << (vm.count("remove") ? " removed" : "") << endl;
            return corrupted.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
        } else if (command == "gc") {
            CHECK(vm.count("contest")) << "gc requires --contest";
            grader::memory_store contest;
            contest.load(nlohmann::json::parse(grader::read_file_content(vm["contest"].as<string>())));

            grader::store::gc_options options;
            options.dry_run = vm.count("dry-run");
            options.min_age = chrono::seconds(vm["min-age"].as<long long>());
            auto report = grader::store::collect_garbage(objects, {&contest}, options);
            cout << "scanned " << report.scanned << ", orphans " << report.orphans << ", deleted " << report.deleted
                 << " (" << report.bytes << " bytes)" << endl;
            return EXIT_SUCCESS;
        } else {
            cerr << "Unrecognized command " << command << endl;
            return EXIT_FAILURE;
        }
    } catch (std::exception& e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }
}
