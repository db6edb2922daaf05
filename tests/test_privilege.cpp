#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include <type_traits>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostwatch {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(PrivilegeTest, IsPrivilegeAvailable) {
#ifdef HOSTWATCH_HAVE_LIBCAP
    EXPECT_TRUE(is_privilege_available());
#else
    EXPECT_FALSE(is_privilege_available());
#endif
}

TEST_F(PrivilegeTest, FunctionSignatures) {
    EXPECT_TRUE((std::is_invocable_r_v<bool, decltype(&drop_capabilities)>));
    EXPECT_TRUE((std::is_invocable_r_v<bool, decltype(&is_privilege_available)>));
}

#ifndef HOSTWATCH_HAVE_LIBCAP
TEST_F(PrivilegeTest, DropCapabilitiesWithoutLibcapSucceeds) {
    EXPECT_TRUE(drop_capabilities());
}
#else
TEST_F(PrivilegeTest, DropCapabilitiesInChildProcess) {
    // Child only: the test process keeps its capability sets.
    pid_t pid = fork();
    ASSERT_NE(pid, -1) << "Failed to fork process";
    if (pid == 0) {
        _exit(drop_capabilities() ? 0 : 1);
    }
    int status = 0;
    waitpid(pid, &status, 0);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
#endif

}
