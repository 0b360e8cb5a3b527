// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("SDOSRV_CTL_SOCK");
    const std::string want = "/tmp/sdosrv-test.sock";
    g.set(want);

    // no "defaults to" line when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("defaults to") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("SDOSRV_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "sdosrv-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/sdosrv/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket defaults to " + want), std::string::npos);
}

TEST(Env_NodeId, DefaultAndRange)
{
    EnvGuard g("SDOSRV_NODE_ID");
    g.unset();
    EXPECT_EQ(constants::node_id_from_env(), constants::DEFAULT_NODE_ID);

    g.set("0x7F");
    EXPECT_EQ(constants::node_id_from_env(), 127);
    g.set("42");
    EXPECT_EQ(constants::node_id_from_env(), 42);

    testing::internal::CaptureStderr();
    g.set("128");
    EXPECT_EQ(constants::node_id_from_env(), constants::DEFAULT_NODE_ID);
    g.set("0");
    EXPECT_EQ(constants::node_id_from_env(), constants::DEFAULT_NODE_ID);
    g.set("five");
    EXPECT_EQ(constants::node_id_from_env(), constants::DEFAULT_NODE_ID);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Ignoring invalid SDOSRV_NODE_ID"), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace sdosrv;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    ASSERT_TRUE(set_log_level_by_name("ERROR"));
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    ASSERT_TRUE(set_log_level_by_name("debug"));
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
    EXPECT_NE(out3.find("[DEBUG]"), std::string::npos);

    // unknown names leave the level alone
    EXPECT_FALSE(set_log_level_by_name("verbose"));
    EXPECT_FALSE(set_log_level_by_name(nullptr));
    EXPECT_EQ(global_level(), Level::Debug);

    set_log_level(Level::Info);
}

TEST(LogLevel, SystemLinesPassEveryThreshold)
{
    using namespace sdosrv;

    for (Level lv : {Level::Debug, Level::Error, Level::System})
    {
        set_log_level(lv);
        testing::internal::CaptureStderr();
        LOG_SYSTEM("status_line");
        std::string out = testing::internal::GetCapturedStderr();
        EXPECT_NE(out.find("[SYSTEM]"), std::string::npos) << static_cast<int>(lv);
        EXPECT_NE(out.find("status_line"), std::string::npos);
    }

    // at the System threshold even errors are dropped
    testing::internal::CaptureStderr();
    LOG_ERROR("error_hidden");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out.find("error_hidden") == std::string::npos);

    set_log_level(Level::Info);
}

TEST(LogLevel, HexBytes)
{
    const std::uint8_t b[] = {0x43, 0x00, 0x10};
    EXPECT_EQ(sdosrv::hex_bytes(b, 3), "0x43 0x00 0x10");
    EXPECT_EQ(sdosrv::hex_bytes(b, 0), "");
}
