#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace locksmith;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("locksmith_config_" +
           std::string(::testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name()));
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  std::string write(const std::string &content) {
    fs::path path = dir / "config.yaml";
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path.string();
  }
};

TEST_F(ConfigTest, ClientDefaults) {
  ClientConfig config;
  EXPECT_EQ(config.host, "localhost");
  EXPECT_EQ(config.port, 33013);
  EXPECT_FALSE(config.user.has_value());
  EXPECT_DOUBLE_EQ(config.timeout, 1.0);
  EXPECT_FALSE(config.log_level.has_value());
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, LoadsClientFile) {
  ClientConfig config = load_client_config(write("host: 10.0.0.5\n"
                                                 "port: 3301\n"
                                                 "user: test\n"
                                                 "password: secret\n"
                                                 "timeout: 2.5\n"
                                                 "log_level: debug\n"));
  EXPECT_EQ(config.host, "10.0.0.5");
  EXPECT_EQ(config.port, 3301);
  EXPECT_EQ(config.user, std::optional<std::string>("test"));
  EXPECT_EQ(config.password, std::optional<std::string>("secret"));
  EXPECT_DOUBLE_EQ(config.timeout, 2.5);
  EXPECT_EQ(config.log_level, std::optional<std::string>("debug"));

  ConnectionParams params = config.connection_params();
  EXPECT_EQ(params.host, "10.0.0.5");
  EXPECT_EQ(params.port, 3301);
  EXPECT_EQ(params.user, config.user);
  EXPECT_DOUBLE_EQ(params.timeout, 2.5);
}

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
  ClientConfig config = load_client_config(write(""));
  EXPECT_EQ(config.host, "localhost");
  EXPECT_EQ(config.port, 33013);
}

TEST_F(ConfigTest, MissingFileIsConfigurationError) {
  EXPECT_THROW(load_client_config((dir / "nope.yaml").string()),
               ConfigurationError);
}

TEST_F(ConfigTest, NonIntegerPortIsRejected) {
  EXPECT_THROW(load_client_config(write("port: abc\n")), ConfigurationError);
  EXPECT_THROW(load_client_config(write("port: 33.5\n")), ConfigurationError);
}

TEST_F(ConfigTest, NonMappingIsRejected) {
  EXPECT_THROW(load_client_config(write("- a\n- b\n")), ConfigurationError);
}

TEST_F(ConfigTest, ClientValidation) {
  ClientConfig config;
  config.host = "";
  EXPECT_THROW(config.validate(), ConfigurationError);

  config = ClientConfig();
  config.port = 0;
  EXPECT_THROW(config.validate(), ConfigurationError);
  config.port = 65536;
  EXPECT_THROW(config.validate(), ConfigurationError);

  config = ClientConfig();
  config.timeout = 0;
  EXPECT_THROW(config.validate(), ConfigurationError);

  config = ClientConfig();
  config.log_level = "loud";
  EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST_F(ConfigTest, ServerAllowsEphemeralPort) {
  ServerConfig config = load_server_config(write("host: 127.0.0.1\n"
                                                 "port: 0\n"));
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 0);
}

TEST_F(ConfigTest, ServerSessionIdleTimeout) {
  EXPECT_DOUBLE_EQ(ServerConfig().session_idle_timeout, 30.0);

  ServerConfig config =
      load_server_config(write("session_idle_timeout: 0.5\n"));
  EXPECT_DOUBLE_EQ(config.session_idle_timeout, 0.5);

  EXPECT_THROW(load_server_config(write("session_idle_timeout: 0\n")),
               ConfigurationError);
  EXPECT_THROW(load_server_config(write("session_idle_timeout: soon\n")),
               ConfigurationError);
}

TEST_F(ConfigTest, ServerPasswordNeedsUser) {
  EXPECT_THROW(load_server_config(write("password: secret\n")),
               ConfigurationError);
}

TEST(Logging, ParsesLevels) {
  EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
  EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
  EXPECT_THROW(parse_log_level("verbose"), ConfigurationError);
}

TEST(Logging, ThresholdIsProcessWide) {
  LogLevel before = log_level();
  set_log_level(LogLevel::ERROR);
  EXPECT_EQ(log_level(), LogLevel::ERROR);
  set_log_level(before);
}
