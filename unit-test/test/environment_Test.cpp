#include "test/environment.hpp"
#include <glog/logging.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"
#include "store/memory_backend.hpp"

namespace grader {
using namespace std;

void setup_test_environment() {
    if (getenv("DEBUG")) grader::DEBUG = true;

    grader::RUN_DIR = filesystem::temp_directory_path() / "grader-test" / "run";
    filesystem::create_directories(grader::RUN_DIR);
    CHECK(filesystem::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";
}

unique_ptr<store::object_store> make_memory_object_store() {
    return make_unique<store::object_store>(make_unique<store::memory_backend>());
}

void prepare_contest(memory_store &contest, store::object_store &objects, int testcases) {
    language sh;
    sh.name = "sh";
    sh.compile_command = {"/bin/sh", "-c", "cp main.sh program"};
    sh.run_command = {"/bin/sh", "program"};
    sh.executable = "program";
    contest.add_language(sh);

    dataset ds;
    ds.id = "d1";
    ds.task = "double";
    ds.limits = {1, 2, 256 << 20};
    for (int i = 1; i <= testcases; ++i) {
        testcase tc;
        tc.id = "t" + to_string(i);
        tc.input_digest = objects.put(to_string(i) + "\n");
        tc.output_digest = objects.put(to_string(2 * i) + "\n");
        ds.testcases.push_back(tc);
    }
    contest.add_dataset(ds);

    submission submit;
    submit.id = "s1";
    submit.task = "double";
    submit.language = "sh";
    submit.files["main.sh"] = objects.put("read x\necho $((x * 2))\n");
    contest.add_submission(submit);
}

execution_result make_execution_result(status stat, const string &output_file, const string &content) {
    execution_result result;
    result.stat = stat;
    result.exitcode = stat == status::OK ? 0 : 1;
    if (!output_file.empty()) result.output_files[output_file] = content;
    if (stat == status::SANDBOX_ERROR) result.message = "mocked sandbox failure";
    return result;
}

}  // namespace grader
