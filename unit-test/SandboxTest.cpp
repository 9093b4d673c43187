#include <csignal>
#include <filesystem>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/runguard.hpp"
#include "sandbox/sandbox.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace grader;

class SandboxTest : public ::testing::Test {
protected:
    path saved_run_dir;
    process_sandbox box;

    void SetUp() override {
        setup_test_environment();
        saved_run_dir = RUN_DIR;
        RUN_DIR = RUN_DIR / ("sandbox-test-" + random_id());
        create_directories(RUN_DIR);
    }

    void TearDown() override {
        remove_all(RUN_DIR);
        RUN_DIR = saved_run_dir;
    }

    execution shell(const string &script) {
        execution exec;
        exec.command = {"/bin/sh", "-c", script};
        exec.limits = {2, 5, 256 << 20};
        return exec;
    }
};

TEST_F(SandboxTest, NormalExitTest) {
    auto exec = shell("cat input.txt; echo err >&2; echo produced > out.txt");
    exec.input_files["input.txt"] = "hello\n";
    exec.output_files = {"out.txt", "never.txt"};

    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::OK) << result.message;
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "err\n");
    EXPECT_EQ(result.output_files.at("out.txt"), "produced\n");
    EXPECT_FALSE(result.output_files.count("never.txt"));

    // 执行结束后私有目录被删除
    EXPECT_TRUE(is_empty(RUN_DIR));
}

TEST_F(SandboxTest, StandardInputTest) {
    auto exec = shell("read x; echo $((x + 1))");
    exec.input_files["in"] = "41\n";
    exec.stdin_file = "in";

    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::OK) << result.message;
    EXPECT_EQ(result.stdout_data, "42\n");
}

TEST_F(SandboxTest, ExecutableTest) {
    execution exec;
    exec.command = {"./program"};
    exec.input_files["program"] = "#!/bin/sh\necho ran\n";
    exec.executables = {"program"};
    exec.limits = {2, 5, 256 << 20};

    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::OK) << result.message;
    EXPECT_EQ(result.stdout_data, "ran\n");
}

TEST_F(SandboxTest, RuntimeErrorTest) {
    auto result = box.run(shell("exit 3"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.exitcode, 3);

    result = box.run(shell("kill -SEGV $$"));
    EXPECT_EQ(result.stat, status::RUNTIME_ERROR);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST_F(SandboxTest, TimeLimitExceededTest) {
    auto exec = shell("while true; do :; done");
    exec.limits = {1, 3, 256 << 20};
    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::TIME_LIMIT_EXCEEDED);

    exec = shell("sleep 10");
    exec.limits = {1, 1, 256 << 20};
    result = box.run(exec);
    EXPECT_EQ(result.stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(SandboxTest, MemoryLimitExceededTest) {
    // 命令替换把 100MB 的输出全部读入 shell 进程的内存
    auto exec = shell("x=$(yes | head -c 100000000); echo ${#x}");
    exec.limits = {5, 10, 32 << 20};
    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::MEMORY_LIMIT_EXCEEDED) << "memory used " << result.memory_used;
    EXPECT_GE(result.memory_used, (size_t)(32 << 20));

    exec = shell("x=$(yes | head -c 1000000); echo ${#x}");
    exec.limits = {5, 10, 32 << 20};
    EXPECT_EQ(box.run(exec).stat, status::OK);
}

TEST_F(SandboxTest, RunguardMemoryLimitExceededTest) {
    // 模拟 runguard 在 cgroup 内存耗尽时写出的 meta 文件
    path runguard = RUN_DIR / "fake-runguard";
    write_file_content(runguard,
                       "#!/bin/sh\n"
                       "for arg in \"$@\"; do\n"
                       "    case \"$arg\" in --out-meta=*) meta=\"${arg#--out-meta=}\" ;; esac\n"
                       "done\n"
                       "printf 'exitcode: 137\\nsignal: 9\\ncpu-time: 0.2\\nwall-time: 0.3\\nmemory-bytes: 33554432\\n' > \"$meta\"\n"
                       "exit 137\n");
    permissions(runguard, perms::owner_all);

    runguard_sandbox guarded(runguard);
    auto exec = shell("true");
    exec.limits = {1, 2, 32 << 20};
    auto result = guarded.run(exec);
    EXPECT_EQ(result.stat, status::MEMORY_LIMIT_EXCEEDED) << result.message;
    EXPECT_EQ(result.memory_used, (size_t)(32 << 20));

    exec.limits.memory = 64 << 20;
    EXPECT_EQ(guarded.run(exec).stat, status::RUNTIME_ERROR);
}

TEST_F(SandboxTest, SandboxErrorTest) {
    execution exec;
    exec.command = {"/nonexistent/program"};
    auto result = box.run(exec);
    EXPECT_EQ(result.stat, status::SANDBOX_ERROR);
    EXPECT_FALSE(result.message.empty());

    exec.command.clear();
    EXPECT_EQ(box.run(exec).stat, status::SANDBOX_ERROR);
}

TEST_F(SandboxTest, UnsafePathTest) {
    auto exec = shell("true");
    exec.input_files["../escape"] = "x";
    EXPECT_EQ(box.run(exec).stat, status::SANDBOX_ERROR);
    EXPECT_FALSE(exists(RUN_DIR / "escape"));
}

TEST_F(SandboxTest, RunguardResultTest) {
    path meta = RUN_DIR / "meta";
    write_file_content(meta, "exitcode: 0\nsignal: 9\ncpu-time: 1.5\nwall-time: 2.25\nmemory-bytes: 1048576\ntime-result: hard-timelimit\n");
    runguard_result result = read_runguard_result(meta);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, 9);
    EXPECT_DOUBLE_EQ(result.cpu_time, 1.5);
    EXPECT_DOUBLE_EQ(result.wall_time, 2.25);
    EXPECT_EQ(result.memory, 1048576);
    EXPECT_EQ(result.time_result, "hard-timelimit");
}
