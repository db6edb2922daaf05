#include <gtest/gtest.h>
#include "../src/core/ProcessRunner.h"
#include "../src/core/Cancellation.h"
#include <chrono>
#include <thread>

namespace hostwatch {

using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    static std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start){
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }
};

TEST_F(ProcessRunnerTest, CapturesStdout) {
    ProcessResult r = run_process({"echo", "hello", "world"}, 5000ms);
    EXPECT_TRUE(r.exited_ok());
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, "hello world\n");
    EXPECT_TRUE(r.err.empty());
}

TEST_F(ProcessRunnerTest, CapturesStderrSeparately) {
    ProcessResult r = run_process({"sh", "-c", "echo out; echo oops >&2"}, 5000ms);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "oops\n");
}

TEST_F(ProcessRunnerTest, ReportsExitCode) {
    ProcessResult r = run_process({"sh", "-c", "exit 3"}, 5000ms);
    EXPECT_FALSE(r.spawn_failed);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.exited_ok());
}

TEST_F(ProcessRunnerTest, MissingProgramIsSpawnFailure) {
    ProcessResult r = run_process({"/nonexistent/hostwatch-no-such-binary"}, 5000ms);
    EXPECT_TRUE(r.spawn_failed);
    EXPECT_FALSE(r.error.empty());
    EXPECT_FALSE(r.exited_ok());
}

TEST_F(ProcessRunnerTest, EmptyArgvIsSpawnFailure) {
    ProcessResult r = run_process({}, 1000ms);
    EXPECT_TRUE(r.spawn_failed);
}

TEST_F(ProcessRunnerTest, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    ProcessResult r = run_process({"sleep", "5"}, 100ms);
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.exited_ok());
    EXPECT_FALSE(r.error.empty());
    EXPECT_LT(elapsed_since(start).count(), 2000);
}

TEST_F(ProcessRunnerTest, AlreadyCancelledDoesNotSpawn) {
    CancellationToken cancel;
    cancel.cancel();
    ProcessResult r = run_process({"echo", "x"}, 1000ms, &cancel);
    EXPECT_TRUE(r.cancelled);
    EXPECT_TRUE(r.out.empty());
}

TEST_F(ProcessRunnerTest, CancelWhileRunning) {
    CancellationToken cancel;
    std::thread canceller([&]{
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    ProcessResult r = run_process({"sleep", "5"}, 0ms, &cancel);
    canceller.join();
    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.timed_out);
    EXPECT_LT(elapsed_since(start).count(), 2000);
}

TEST_F(ProcessRunnerTest, CancellationTokenWaitFor) {
    CancellationToken cancel;
    EXPECT_FALSE(cancel.wait_for(20ms));
    cancel.request_cancel();
    EXPECT_TRUE(cancel.cancelled());
    EXPECT_TRUE(cancel.wait_for(5s));
}

}
