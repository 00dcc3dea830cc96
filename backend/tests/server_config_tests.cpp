#include <gtest/gtest.h>
#include "core/ServerConfig.hpp"
#include <cstdlib>
#include <vector>

using routesim::ServerConfig;
using routesim::load_server_config;

namespace {

ServerConfig load(std::vector<const char*> args) {
    args.insert(args.begin(), "routesim_backend");
    return load_server_config(static_cast<int>(args.size()), args.data());
}

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("ROUTESIM_PORT");
        unsetenv("ROUTESIM_BIND");
    }
    void TearDown() override { SetUp(); }
};

} // namespace

TEST_F(ServerConfigTest, Defaults) {
    auto cfg = load({});
    EXPECT_EQ(cfg.port, 8085);
    EXPECT_EQ(cfg.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.threads, 0u);
    EXPECT_FALSE(cfg.quiet);
    EXPECT_FALSE(cfg.show_help);
}

TEST_F(ServerConfigTest, Flags) {
    auto cfg = load({"-p", "9000", "--bind", "127.0.0.1", "-t", "4", "-q"});
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.bind_address, "127.0.0.1");
    EXPECT_EQ(cfg.threads, 4u);
    EXPECT_TRUE(cfg.quiet);

    EXPECT_EQ(load({"--port=7001"}).port, 7001);
    EXPECT_EQ(load({"--port", "7002", "--threads", "2"}).threads, 2u);
    EXPECT_TRUE(load({"--help"}).show_help);
    EXPECT_TRUE(load({"-h"}).show_help);
}

TEST_F(ServerConfigTest, LegacyNumericFirstArgument) {
    EXPECT_EQ(load({"8100"}).port, 8100);
    EXPECT_EQ(load({"8100", "--port", "8200"}).port, 8200);
}

TEST_F(ServerConfigTest, EnvironmentIsOverriddenByFlags) {
    setenv("ROUTESIM_PORT", "9100", 1);
    setenv("ROUTESIM_BIND", "::1", 1);
    auto cfg = load({});
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.bind_address, "::1");

    EXPECT_EQ(load({"-p", "9200"}).port, 9200);
}

TEST_F(ServerConfigTest, InvalidValuesKeepDefaults) {
    EXPECT_EQ(load({"-p", "http"}).port, 8085);
    EXPECT_EQ(load({"--port=70000"}).port, 8085);
    EXPECT_EQ(load({"-p", "-1"}).port, 8085);
    EXPECT_EQ(load({"-t", "many"}).threads, 0u);

    setenv("ROUTESIM_PORT", "eighty", 1);
    EXPECT_EQ(load({}).port, 8085);
}

TEST_F(ServerConfigTest, PortZeroIsAllowed) {
    EXPECT_EQ(load({"-p", "0"}).port, 0);
}

TEST(ServerConfig, ResolveThreadCount) {
    ServerConfig cfg;
    cfg.threads = 3;
    EXPECT_EQ(routesim::resolve_thread_count(cfg), 3u);
    cfg.threads = 0;
    EXPECT_GE(routesim::resolve_thread_count(cfg), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
