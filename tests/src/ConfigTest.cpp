#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <string>

#include "Config.hpp"
#include "catch.hpp"

using namespace sessionhub;

using Catch::Matchers::Contains;

namespace {

ConfigMap hubOptions() {
  return {
      {"listen_port", ConfigValueType::INT, "3000", ConfigValueSettings::REQUIRED},
      {"websocket_path", ConfigValueType::STRING, "/ws", ConfigValueSettings::REQUIRED},
      {"enable_redis", ConfigValueType::BOOL, "false", ConfigValueSettings::REQUIRED},
      {"redis_password", ConfigValueType::STRING, "", ConfigValueSettings::OPTIONAL},
  };
}

std::string writeTempFile(const std::string& contents) {
  char path[] = "/tmp/sessionhub-config-XXXXXX";
  int fd      = mkstemp(path);
  REQUIRE(fd != -1);
  close(fd);

  std::ofstream out(path);
  out << contents;
  return path;
}

} // namespace

TEST_CASE("Defaults from the option table", "[config]") {
  Config cfg(hubOptions());
  cfg.load();

  CHECK(cfg.get<int>("listen_port") == 3000);
  CHECK(cfg.get<std::string>("websocket_path") == "/ws");
  CHECK(cfg.get<bool>("enable_redis") == false);
  CHECK(cfg.get<std::string>("redis_password").empty());
}

TEST_CASE("Inline values", "[config]") {
  Config cfg(hubOptions());

  SECTION("Later lines override defaults") {
    cfg << "listen_port = 8080\n";
    cfg << "  websocket_path=\"/session\"  \n";
    cfg.load();

    CHECK(cfg.get<int>("listen_port") == 8080);
    CHECK(cfg.get<std::string>("websocket_path") == "/session");
  }

  SECTION("Comments and blank lines are skipped") {
    cfg << "# listen_port = 1\n\n   \n  # another comment\nlisten_port = 4000\n";
    cfg.load();
    CHECK(cfg.get<int>("listen_port") == 4000);
  }

  SECTION("Single quotes are stripped, mismatched ones are kept") {
    cfg << "websocket_path = '/a'\n";
    cfg << "redis_password = 'secret\"\n";
    cfg.load();

    CHECK(cfg.get<std::string>("websocket_path") == "/a");
    CHECK(cfg.get<std::string>("redis_password") == "'secret\"");
  }

  SECTION("Booleans accept common spellings in any case") {
    for (const char* yes : {"true", "TRUE", "Yes", "on", "1"}) {
      Config c(hubOptions());
      c << std::string("enable_redis = ") + yes + "\n";
      c.load();
      CHECK(c.get<bool>("enable_redis"));
    }

    for (const char* no : {"false", "False", "NO", "off", "0"}) {
      Config c(hubOptions());
      c << "enable_redis = true\n";
      c << std::string("enable_redis = ") + no + "\n";
      c.load();
      CHECK_FALSE(c.get<bool>("enable_redis"));
    }
  }
}

TEST_CASE("Invalid configuration is rejected", "[config]") {
  Config cfg(hubOptions());

  SECTION("Missing equals sign") {
    cfg << "listen_port 8080\n";
    REQUIRE_THROWS_AS(cfg.load(), SyntaxErrorException);
  }

  SECTION("Empty value") {
    cfg << "websocket_path =\n";
    REQUIRE_THROWS_AS(cfg.load(), SyntaxErrorException);
  }

  SECTION("Unknown option") {
    cfg << "no_such_option = 1\n";
    REQUIRE_THROWS_AS(cfg.load(), InvalidConfigOptionException);
  }

  SECTION("Trailing garbage after a number") {
    cfg << "listen_port = 80abc\n";
    REQUIRE_THROWS_WITH(cfg.load(), Contains("Invalid number"));
  }

  SECTION("Not a boolean") {
    cfg << "enable_redis = maybe\n";
    REQUIRE_THROWS_WITH(cfg.load(), Contains("Invalid boolean"));
  }

  SECTION("Errors name the offending line") {
    Config bare;
    bare.defineOption<int>("listen_port");
    bare << "listen_port = 1\n\nbroken\n";
    REQUIRE_THROWS_WITH(bare.load(), Contains("<inline>:3"));
  }
}

TEST_CASE("Required options must be set", "[config]") {
  Config cfg;
  cfg.defineOption<int>("topic_capacity");
  cfg.defineOption<std::string>("log_level", ConfigValueSettings::OPTIONAL);

  REQUIRE_THROWS_AS(cfg.load(), RequiredOptionMissingException);

  cfg << "topic_capacity = 16\n";
  cfg.load();
  CHECK(cfg.get<int>("topic_capacity") == 16);
  CHECK(cfg.get<std::string>("log_level").empty());
}

TEST_CASE("Option definitions", "[config]") {
  Config cfg;
  cfg.defineOption<int>("topic_capacity");

  REQUIRE_THROWS(cfg.defineOption<bool>("topic_capacity"));
  REQUIRE_THROWS_AS(cfg.get<int>("undefined"), InvalidConfigOptionException);
  REQUIRE_THROWS_WITH(cfg.get<std::string>("topic_capacity"), Contains("invalid type"));
}

TEST_CASE("Loading from a file", "[config]") {
  Config cfg(hubOptions());

  SECTION("File values override defaults") {
    const auto path = writeTempFile("# hub settings\nlisten_port = 9000\nenable_redis = yes\n");
    cfg.setFile(path);
    cfg.load();

    CHECK(cfg.get<int>("listen_port") == 9000);
    CHECK(cfg.get<bool>("enable_redis"));
    unlink(path.c_str());
  }

  SECTION("Syntax errors carry the file name") {
    const auto path = writeTempFile("listen_port = 9000\nwebsocket_path\n");
    cfg.setFile(path);
    REQUIRE_THROWS_WITH(cfg.load(), Contains(path + ":2"));
    unlink(path.c_str());
  }

  SECTION("Missing file") {
    cfg.setFile("/nonexistent/sessionhub.conf");
    REQUIRE_THROWS_WITH(cfg.load(), Contains("Could not open config file"));
  }
}

TEST_CASE("Environment overrides file and defaults", "[config]") {
  Config cfg(hubOptions());

  const auto path = writeTempFile("listen_port = 9000\n");
  cfg.setFile(path);
  cfg.setLoadFromEnv(true);

  setenv("LISTEN_PORT", "7000", 1);
  setenv("websocket_path", "/env", 1);
  cfg.load();
  unsetenv("LISTEN_PORT");
  unsetenv("websocket_path");
  unlink(path.c_str());

  CHECK(cfg.get<int>("listen_port") == 7000);
  CHECK(cfg.get<std::string>("websocket_path") == "/env");
}

TEST_CASE("Environment is ignored unless enabled", "[config]") {
  Config cfg(hubOptions());

  setenv("LISTEN_PORT", "7000", 1);
  cfg.load();
  unsetenv("LISTEN_PORT");

  CHECK(cfg.get<int>("listen_port") == 3000);
}

TEST_CASE("clearValues resets to empty values", "[config]") {
  Config cfg(hubOptions());
  cfg.load();
  cfg.clearValues();

  CHECK(cfg.get<int>("listen_port") == 0);
  CHECK(cfg.get<std::string>("websocket_path").empty());
  CHECK_FALSE(cfg.get<bool>("enable_redis"));
}
