#include "sandbox/sandbox.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

sandbox::~sandbox() = default;

execution_result sandbox::run(const execution &exec) {
    execution_result result;
    fs::path dir = fs::absolute(RUN_DIR) / ("sandbox-" + random_id());
    fs::path box = dir / "box";

    error_code ec;
    fs::create_directories(box, ec);
    if (ec) {
        result.message = "unable to create sandbox directory " + dir.string() + ": " + ec.message();
        LOG(ERROR) << result.message;
        return result;
    }

    defer {
        if (DEBUG) {
            LOG(INFO) << "Keeping sandbox directory " << dir;
            return;
        }
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove sandbox directory " << dir << ": " << ec.message();
    };

    try {
        if (exec.command.empty())
            throw invalid_argument("empty command");

        for (auto &[name, content] : exec.input_files) {
            fs::path file = box / assert_safe_path(name);
            fs::create_directories(file.parent_path());
            write_file_content(file, content);
            if (exec.executables.count(name))
                fs::permissions(file, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec);
        }
        if (!exec.stdin_file.empty()) assert_safe_path(exec.stdin_file);

        execute(dir, box, exec, result);

        bool truncated = false;
        if (fs::exists(dir / ".stdout")) {
            result.stdout_data = read_file_content(dir / ".stdout", MAX_OUTPUT_BYTES, truncated);
            if (truncated) DLOG(INFO) << "Standard output of " << exec.command[0] << " is truncated";
        }
        if (fs::exists(dir / ".stderr"))
            result.stderr_data = read_file_content(dir / ".stderr", MAX_OUTPUT_BYTES, truncated);

        for (auto &name : exec.output_files) {
            fs::path file = box / assert_safe_path(name);
            if (fs::is_regular_file(file))
                result.output_files[name] = read_file_content(file);
        }
    } catch (exception &ex) {
        result.stat = status::SANDBOX_ERROR;
        result.message = ex.what();
        LOG(ERROR) << "Sandbox failed to run " << (exec.command.empty() ? string() : exec.command[0]) << ": " << ex.what() << endl
                   << boost::diagnostic_information(ex);
    }
    return result;
}

}  // namespace grader
