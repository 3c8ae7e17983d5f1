#pragma once

#include <functional>
#include <string>
#include <vector>

namespace vertexbridge {

struct GatewayConfig {
  std::string host{"0.0.0.0"};
  int port{8000};
  int http_workers{8};
  std::vector<std::string> cors_origins{"*"};

  bool tls_enabled{false};
  std::string tls_cert_path;
  std::string tls_key_path;

  std::string project_id;
  std::string region{"us-central1"};
  // Default model; always the first catalog entry.
  std::string model{"gemini-2.5-pro-preview-03-25"};
  std::vector<std::string> models;
  std::string endpoint;
  std::string access_token;
  int backend_timeout_seconds{120};

  bool rate_limit_enabled{true};
  int requests_per_minute{150};

  int max_context_tokens{1000000};
  int preferred_context_tokens{200000};

  std::string log_level{"INFO"};
  std::string log_format{"text"};

  // Default model followed by the remaining configured models, no
  // duplicates.
  std::vector<std::string> CatalogIds() const;
  // Limit handed to the rate limiter; 0 when limiting is disabled.
  int EffectiveRateLimit() const {
    return rate_limit_enabled ? requests_per_minute : 0;
  }
};

using EnvLookup = std::function<const char *(const char *)>;

// Reads `path` into *config. A missing file leaves the defaults untouched
// and returns false. Throws YAML::Exception on malformed YAML.
bool LoadConfigFile(const std::string &path, GatewayConfig *config);

// Applies VERTEXBRIDGE_* overrides. `env` defaults to std::getenv.
// Throws std::invalid_argument when a numeric override does not parse.
void ApplyEnvOverrides(GatewayConfig *config, const EnvLookup &env = nullptr);

// Throws std::invalid_argument when the configuration cannot be served.
void ValidateConfig(const GatewayConfig &config);

// LoadConfigFile + ApplyEnvOverrides + ValidateConfig.
GatewayConfig LoadGatewayConfig(const std::string &path,
                                const EnvLookup &env = nullptr);

std::vector<std::string> SplitList(const std::string &raw);

} // namespace vertexbridge
