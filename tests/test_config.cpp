#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "core/config.hpp"
#include "core/error.hpp"
#include "process/process_session.hpp"

using namespace harness;

namespace fs = std::filesystem;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("harness_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path write(const std::string& content) {
    auto path = dir_ / "config.json";
    std::ofstream(path) << content;
    return path;
  }

  fs::path dir_;
};

}  // namespace

TEST(ConfigTest, Defaults) {
  Config config;

  EXPECT_FALSE(config.agent.model.empty());
  EXPECT_FALSE(config.agent.system_prompt.empty());
  EXPECT_TRUE(config.servers.empty());
  EXPECT_EQ(config.process.kill_timeout, std::chrono::milliseconds(2000));
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.log_file.has_value());
}

TEST(ConfigTest, GetNonexistentServer) {
  Config config;
  EXPECT_FALSE(config.get_server("nonexistent").has_value());
}

TEST_F(ConfigFileTest, MissingFileYieldsDefaults) {
  auto config = Config::load(dir_ / "absent.json");
  EXPECT_TRUE(config.servers.empty());
  EXPECT_EQ(config.worker_threads, 2u);
}

TEST_F(ConfigFileTest, LoadsAllSections) {
  auto path = write(R"({
    "agent": {"model": "gpt-4o-mini", "system_prompt": "Be brief."},
    "servers": [
      {"name": "time", "command": "npx", "args": ["-y", "@modelcontextprotocol/server-time"],
       "env": {"TZ": "UTC"}, "working_dir": "/tmp"},
      {"name": "off", "command": "cat", "enabled": false}
    ],
    "process": {"kill_timeout_ms": 750, "drain_timeout_ms": 100},
    "worker_threads": 4,
    "log_level": "debug",
    "log_file": "/tmp/harness.log"
  })");

  auto config = Config::load(path);

  EXPECT_EQ(config.agent.model, "gpt-4o-mini");
  EXPECT_EQ(config.agent.system_prompt, "Be brief.");
  ASSERT_EQ(config.servers.size(), 2u);
  EXPECT_EQ(config.servers[0].args, (std::vector<std::string>{"-y", "@modelcontextprotocol/server-time"}));
  EXPECT_EQ(config.servers[0].env.at("TZ"), "UTC");
  EXPECT_EQ(config.servers[0].working_dir, fs::path("/tmp"));
  EXPECT_TRUE(config.servers[0].enabled);
  EXPECT_FALSE(config.servers[1].enabled);
  EXPECT_EQ(config.process.kill_timeout, std::chrono::milliseconds(750));
  EXPECT_EQ(config.process.drain_timeout, std::chrono::milliseconds(100));
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_file, fs::path("/tmp/harness.log"));

  auto server = config.get_server("time");
  ASSERT_TRUE(server.has_value());
  EXPECT_EQ(server->command, "npx");
}

TEST_F(ConfigFileTest, MalformedFileIsConfigError) {
  auto path = write("{ not json");

  try {
    Config::load(path);
    FAIL() << "expected ConfigError";
  } catch (const HarnessError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
  }
}

TEST_F(ConfigFileTest, ServerWithoutCommandIsConfigError) {
  auto path = write(R"({"servers": [{"name": "broken"}]})");

  try {
    Config::load(path);
    FAIL() << "expected ConfigError";
  } catch (const HarnessError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
  }
}

TEST_F(ConfigFileTest, SaveThenLoad) {
  Config config;
  config.agent.model = "local-model";
  config.servers.push_back(ServerConfig{"echo", "cat", {"-u"}, {{"A", "1"}}, std::nullopt, true});
  config.process.kill_timeout = std::chrono::milliseconds(300);

  auto path = dir_ / "nested" / "saved.json";
  config.save(path);

  auto loaded = Config::load(path);
  EXPECT_EQ(loaded.agent.model, "local-model");
  ASSERT_EQ(loaded.servers.size(), 1u);
  EXPECT_EQ(loaded.servers[0].name, "echo");
  EXPECT_EQ(loaded.servers[0].env.at("A"), "1");
  EXPECT_EQ(loaded.process.kill_timeout, std::chrono::milliseconds(300));
}

TEST(ConfigTest, DescriptorFromServerConfig) {
  ServerConfig server{"time", "npx", {"-y", "server-time"}, {{"TZ", "UTC"}}, fs::path("/srv"), true};

  auto descriptor = ChildProcessDescriptor::from_config(server);
  EXPECT_EQ(descriptor.command, "npx");
  EXPECT_EQ(descriptor.args.size(), 2u);
  EXPECT_EQ(descriptor.env.at("TZ"), "UTC");
  EXPECT_EQ(descriptor.working_dir, fs::path("/srv"));
  EXPECT_EQ(descriptor.display(), "npx -y server-time");
}

TEST(ConfigTest, ConfigPaths) {
  EXPECT_EQ(config_paths::default_config_file().filename(), "config.json");
  EXPECT_EQ(config_paths::config_dir().filename(), "agent-harness");
  EXPECT_EQ(config_paths::project_config_file().parent_path().filename(), ".agent-harness");
}
