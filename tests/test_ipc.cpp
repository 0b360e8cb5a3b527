#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

static void wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return;
        std::this_thread::sleep_for(10ms);
    }
}

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path = std::getenv("HOME");
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", path, 1);
}

TEST(IPC, TestStartServerAndQuit)
{
    // temporary socket path
    std::string sock = "/tmp/sdosrv-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // run server (blocks until QUIT)
    std::thread th([&] { ipc::start_server(sock, nullptr); });
    wait_for_socket(sock);

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "QUIT", &reply));
    EXPECT_EQ(reply, "OK");
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestRequestReply)
{
    std::string sock = "/tmp/sdosrv-ipc-rr-" + std::to_string(getpid()) + ".sock";

    std::mutex               mu;
    std::vector<std::string> seen;
    auto handler = [&](const std::string &line) -> std::string {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(line);
        return "OK echo " + line;
    };
    std::thread th([&] { ipc::start_server(sock, handler); });
    wait_for_socket(sock);

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "GET 0x1000 0", &reply));
    EXPECT_EQ(reply, "OK echo GET 0x1000 0");
    // trailing newline is not part of the line
    ASSERT_TRUE(ipc::request(sock, "STATUS\n", &reply));
    EXPECT_EQ(reply, "OK echo STATUS");
    ASSERT_TRUE(ipc::request(sock, "QUIT", nullptr));
    th.join();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "GET 0x1000 0");
    EXPECT_EQ(seen[2], "QUIT");
}

TEST(IPC, TestRequestWithoutServerFails)
{
    std::string sock = "/tmp/sdosrv-ipc-none-" + std::to_string(getpid()) + ".sock";
    std::string reply;
    EXPECT_FALSE(ipc::request(sock, "STATUS", &reply));
    EXPECT_FALSE(ipc::request(sock, "", &reply));
}
