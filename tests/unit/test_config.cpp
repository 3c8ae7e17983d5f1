#include <catch2/catch.hpp>

#include "server/config/gateway_config.h"

#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

namespace {

// Writes `contents` to a scratch YAML file removed when the test ends.
class TempYaml {
public:
  explicit TempYaml(const std::string &contents) {
    path_ = std::filesystem::temp_directory_path() /
            ("vertexbridge_config_" + std::to_string(++counter_) + ".yaml");
    std::ofstream out(path_);
    out << contents;
  }
  ~TempYaml() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  std::string path() const { return path_.string(); }

private:
  static inline int counter_{0};
  std::filesystem::path path_;
};

vertexbridge::EnvLookup
FakeEnv(const std::map<std::string, std::string> &values) {
  return [values](const char *name) -> const char * {
    auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

} // namespace

TEST_CASE("LoadConfigFile leaves defaults when the file is missing",
          "[config]") {
  vertexbridge::GatewayConfig config;
  REQUIRE_FALSE(vertexbridge::LoadConfigFile(
      "/nonexistent/vertexbridge.yaml", &config));
  REQUIRE(config.port == 8000);
  REQUIRE(config.requests_per_minute == 150);
  REQUIRE(config.preferred_context_tokens == 200000);
  REQUIRE(config.max_context_tokens == 1000000);
  REQUIRE(config.model == "gemini-2.5-pro-preview-03-25");
}

TEST_CASE("LoadConfigFile reads every section", "[config]") {
  TempYaml file(R"(
server:
  host: 127.0.0.1
  http_port: 9100
  workers: 4
  cors_origins: [https://a.example]
backend:
  project_id: demo
  region: europe-west4
  model: gemini-2.0-flash
  models: [gemini-2.0-flash, gemini-1.5-pro]
  timeout_seconds: 30
rate_limit:
  enabled: false
  requests_per_minute: 10
context:
  max_tokens: 5000
  preferred_tokens: 1000
logging:
  level: debug
  format: json
)");
  vertexbridge::GatewayConfig config;
  REQUIRE(vertexbridge::LoadConfigFile(file.path(), &config));
  REQUIRE(config.host == "127.0.0.1");
  REQUIRE(config.port == 9100);
  REQUIRE(config.http_workers == 4);
  REQUIRE(config.cors_origins == std::vector<std::string>{"https://a.example"});
  REQUIRE(config.project_id == "demo");
  REQUIRE(config.region == "europe-west4");
  REQUIRE(config.backend_timeout_seconds == 30);
  REQUIRE(config.CatalogIds() ==
          std::vector<std::string>{"gemini-2.0-flash", "gemini-1.5-pro"});
  REQUIRE_FALSE(config.rate_limit_enabled);
  REQUIRE(config.EffectiveRateLimit() == 0);
  REQUIRE(config.preferred_context_tokens == 1000);
  REQUIRE(config.log_format == "json");
}

TEST_CASE("LoadConfigFile surfaces malformed YAML", "[config]") {
  TempYaml file("server: [unclosed\n");
  vertexbridge::GatewayConfig config;
  REQUIRE_THROWS_AS(vertexbridge::LoadConfigFile(file.path(), &config),
                    YAML::Exception);
}

TEST_CASE("ApplyEnvOverrides takes precedence over file values",
          "[config]") {
  vertexbridge::GatewayConfig config;
  config.project_id = "from-file";
  vertexbridge::ApplyEnvOverrides(
      &config, FakeEnv({{"VERTEXBRIDGE_GCP_PROJECT_ID", "from-env"},
                        {"VERTEXBRIDGE_PORT", "9000"},
                        {"VERTEXBRIDGE_MODELS", "a, b,,c"},
                        {"VERTEXBRIDGE_RATE_LIMIT_RPM", "5"},
                        {"VERTEXBRIDGE_RATE_LIMIT_ENABLED", "yes"},
                        {"VERTEXBRIDGE_BACKEND_TIMEOUT", "15"},
                        {"VERTEXBRIDGE_LOG_FORMAT", "JSON"}}));
  REQUIRE(config.project_id == "from-env");
  REQUIRE(config.port == 9000);
  REQUIRE(config.models == std::vector<std::string>{"a", "b", "c"});
  REQUIRE(config.EffectiveRateLimit() == 5);
  REQUIRE(config.backend_timeout_seconds == 15);
  REQUIRE(config.log_format == "json");
}

TEST_CASE("ApplyEnvOverrides falls back to the gcloud token variable",
          "[config]") {
  vertexbridge::GatewayConfig config;
  vertexbridge::ApplyEnvOverrides(
      &config, FakeEnv({{"GOOGLE_OAUTH_ACCESS_TOKEN", "ya29.fallback"}}));
  REQUIRE(config.access_token == "ya29.fallback");

  vertexbridge::GatewayConfig explicit_token;
  vertexbridge::ApplyEnvOverrides(
      &explicit_token, FakeEnv({{"VERTEXBRIDGE_ACCESS_TOKEN", "primary"},
                                {"GOOGLE_OAUTH_ACCESS_TOKEN", "fallback"}}));
  REQUIRE(explicit_token.access_token == "primary");

  vertexbridge::GatewayConfig from_file;
  from_file.access_token = "file";
  vertexbridge::ApplyEnvOverrides(
      &from_file, FakeEnv({{"GOOGLE_OAUTH_ACCESS_TOKEN", "fallback"}}));
  REQUIRE(from_file.access_token == "file");
}

TEST_CASE("ApplyEnvOverrides rejects non-numeric values", "[config]") {
  vertexbridge::GatewayConfig config;
  REQUIRE_THROWS_AS(vertexbridge::ApplyEnvOverrides(
                        &config, FakeEnv({{"VERTEXBRIDGE_PORT", "80a"}})),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(
      vertexbridge::ApplyEnvOverrides(
          &config, FakeEnv({{"VERTEXBRIDGE_MAX_CONTEXT_SIZE", "lots"}})),
      std::invalid_argument);
}

TEST_CASE("ValidateConfig rejects configurations that cannot serve",
          "[config]") {
  vertexbridge::GatewayConfig good;
  REQUIRE_NOTHROW(vertexbridge::ValidateConfig(good));

  auto bad = good;
  bad.preferred_context_tokens = bad.max_context_tokens + 1;
  REQUIRE_THROWS_AS(vertexbridge::ValidateConfig(bad), std::invalid_argument);

  bad = good;
  bad.port = 70000;
  REQUIRE_THROWS_AS(vertexbridge::ValidateConfig(bad), std::invalid_argument);

  bad = good;
  bad.model.clear();
  REQUIRE_THROWS_AS(vertexbridge::ValidateConfig(bad), std::invalid_argument);

  bad = good;
  bad.tls_enabled = true;
  REQUIRE_THROWS_AS(vertexbridge::ValidateConfig(bad), std::invalid_argument);
}

TEST_CASE("LoadGatewayConfig combines file, environment and validation",
          "[config]") {
  TempYaml file("backend:\n  project_id: demo\n");
  auto config = vertexbridge::LoadGatewayConfig(
      file.path(), FakeEnv({{"VERTEXBRIDGE_GCP_REGION", "asia-east1"}}));
  REQUIRE(config.project_id == "demo");
  REQUIRE(config.region == "asia-east1");

  REQUIRE_THROWS_AS(
      vertexbridge::LoadGatewayConfig(
          file.path(), FakeEnv({{"VERTEXBRIDGE_PREFERRED_CONTEXT_SIZE", "0"}})),
      std::invalid_argument);
}

TEST_CASE("SplitList trims and skips empty entries", "[config]") {
  REQUIRE(vertexbridge::SplitList(" a ,b,, c ") ==
          std::vector<std::string>{"a", "b", "c"});
  REQUIRE(vertexbridge::SplitList("").empty());
}
