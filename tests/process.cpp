#include <unistd.h>

#include <chrono>
#include <csignal>
#include <thread>

#include "gtest/gtest.h"
#include "multiprocess.h"

namespace mpc = snipexec::multiproc;
using namespace std::chrono_literals;

TEST(process, exitStatus) {
    mpc::Process proc([] { _exit(7); });
    ASSERT_FALSE(proc.failed());
    proc.join();
    EXPECT_FALSE(proc.is_alive());
    EXPECT_TRUE(proc.if_exited());
    EXPECT_EQ(proc.exit_status(), 7);
}
TEST(process, returnMeansZero) {
    mpc::Process proc([] {});
    proc.join();
    EXPECT_TRUE(proc.if_exited());
    EXPECT_EQ(proc.exit_status(), 0);
}
TEST(process, ownGroup) {
    mpc::Process proc([] {
        std::this_thread::sleep_for(5s);
        _exit(0);
    });
    EXPECT_EQ(getpgid(proc.pid()), proc.pid());
    EXPECT_EQ(proc.kill_group(SIGKILL), 0);
    proc.join();
    EXPECT_TRUE(proc.if_signaled());
    EXPECT_EQ(proc.term_sig(), SIGKILL);
}
TEST(process, waitForDeadline) {
    mpc::Process proc([] {
        std::this_thread::sleep_for(5s);
        _exit(0);
    });
    const auto start = mpc::Process::clock::now();
    EXPECT_FALSE(proc.wait_for(start + 100ms));
    EXPECT_GE(mpc::Process::clock::now() - start, 100ms);
    EXPECT_TRUE(proc.is_alive());
    proc.kill(SIGKILL);
    EXPECT_TRUE(proc.wait_for(mpc::Process::clock::now() + 5s));
    EXPECT_TRUE(proc.if_signaled());
}
TEST(process, waitForExit) {
    mpc::Process proc([] { _exit(3); });
    EXPECT_TRUE(proc.wait_for(mpc::Process::clock::now() + 5s));
    EXPECT_EQ(proc.exit_status(), 3);
}
TEST(process, killedOnDestruction) {
    pid_t pid = 0;
    {
        mpc::Process proc([] {
            std::this_thread::sleep_for(30s);
            _exit(0);
        });
        pid = proc.pid();
        EXPECT_TRUE(proc.is_alive());
    }
    EXPECT_EQ(kill(pid, 0), -1);
}
