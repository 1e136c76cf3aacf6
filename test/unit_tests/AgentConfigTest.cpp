#include "AgentConfig.hpp"

#include "TempFile.hpp"
#include "TestHeaders.hpp"

using namespace sshed;

TEST_CASE("Agent configuration files", "[AgentConfig]") {
  TempDirectory directory(GetTempDirectory(), "sshed_config_");
  string configPath = directory.getPath() + "/sshed.cfg";
  AgentConfig config;

  SECTION("Defaults") {
    REQUIRE(config.maxConnections == 8);
    REQUIRE(config.contextLines == 3);
    REQUIRE(config.verbose == 0);
    REQUIRE(config.logSize == "20971520");
    REQUIRE(config.editor.empty());
    REQUIRE(config.socketAddress.empty());
  }

  SECTION("Every setting") {
    writeFileContents(configPath,
                      "[Agent]\n"
                      "socket = /run/user/sshed.sock\n"
                      "max_connections = 2\n"
                      "editor = code --wait\n"
                      "context_lines = 5\n"
                      "[Debug]\n"
                      "verbose = 4\n"
                      "logsize = 1024\n"
                      "logdir = /var/tmp/sshed-logs\n");
    config.loadFile(configPath);
    REQUIRE(config.socketAddress == "/run/user/sshed.sock");
    REQUIRE(config.maxConnections == 2);
    REQUIRE(config.editor == "code --wait");
    REQUIRE(config.contextLines == 5);
    REQUIRE(config.verbose == 4);
    REQUIRE(config.logSize == "1024");
    REQUIRE(config.logDirectory == "/var/tmp/sshed-logs");
  }

  SECTION("Missing keys keep their defaults") {
    writeFileContents(configPath, "[Debug]\nverbose = 1\n");
    config.loadFile(configPath);
    REQUIRE(config.verbose == 1);
    REQUIRE(config.maxConnections == 8);
  }

  SECTION("Invalid values") {
    writeFileContents(configPath, "[Agent]\nmax_connections = 0\n");
    REQUIRE_THROWS_AS(config.loadFile(configPath), std::runtime_error);
    writeFileContents(configPath, "[Agent]\ncontext_lines = -1\n");
    REQUIRE_THROWS_AS(config.loadFile(configPath), std::runtime_error);
    writeFileContents(configPath, "[Debug]\nlogsize = lots\n");
    REQUIRE_THROWS_AS(config.loadFile(configPath), std::runtime_error);
  }

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(config.loadFile(directory.getPath() + "/missing.cfg"),
                      std::runtime_error);
  }
}

TEST_CASE("Counts are plain decimal numbers", "[AgentConfig]") {
  REQUIRE(AgentConfig::parseCount("k", "12") == 12);
  REQUIRE(AgentConfig::parseCount("k", " 7 ") == 7);
  REQUIRE_THROWS_AS(AgentConfig::parseCount("k", ""), std::runtime_error);
  REQUIRE_THROWS_AS(AgentConfig::parseCount("k", "3x"), std::runtime_error);
  REQUIRE_THROWS_AS(AgentConfig::parseCount("k", "9999999999"),
                    std::runtime_error);
}
