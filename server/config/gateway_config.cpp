#include "server/config/gateway_config.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace vertexbridge {

namespace {
std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

bool ParseBool(const std::string &value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

int ParseInt(const char *name, const std::string &value) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string(name) + " must be an integer");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument(std::string(name) + " must be an integer");
  }
  return parsed;
}

std::vector<std::string> StringList(const YAML::Node &node) {
  std::vector<std::string> out;
  if (node.IsSequence()) {
    for (const auto &item : node) {
      out.push_back(item.as<std::string>());
    }
  } else if (node.IsScalar()) {
    out = SplitList(node.as<std::string>());
  }
  return out;
}
} // namespace

std::vector<std::string> SplitList(const std::string &raw) {
  std::vector<std::string> out;
  std::stringstream ss(raw);
  std::string segment;
  while (std::getline(ss, segment, ',')) {
    auto value = Trim(segment);
    if (!value.empty()) {
      out.push_back(value);
    }
  }
  return out;
}

std::vector<std::string> GatewayConfig::CatalogIds() const {
  std::vector<std::string> ids;
  if (!model.empty()) {
    ids.push_back(model);
  }
  for (const auto &id : models) {
    if (!id.empty() && std::find(ids.begin(), ids.end(), id) == ids.end()) {
      ids.push_back(id);
    }
  }
  return ids;
}

bool LoadConfigFile(const std::string &path, GatewayConfig *config) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return false;
  }
  YAML::Node root = YAML::LoadFile(path);

  if (auto server = root["server"]) {
    if (server["host"]) config->host = server["host"].as<std::string>();
    if (server["http_port"]) config->port = server["http_port"].as<int>();
    if (server["workers"]) config->http_workers = server["workers"].as<int>();
    if (server["cors_origins"]) {
      config->cors_origins = StringList(server["cors_origins"]);
    }
  }
  if (auto tls = root["tls"]) {
    if (tls["enabled"]) config->tls_enabled = tls["enabled"].as<bool>();
    if (tls["cert_path"]) config->tls_cert_path = tls["cert_path"].as<std::string>();
    if (tls["key_path"]) config->tls_key_path = tls["key_path"].as<std::string>();
  }
  if (auto backend = root["backend"]) {
    if (backend["project_id"]) config->project_id = backend["project_id"].as<std::string>();
    if (backend["region"]) config->region = backend["region"].as<std::string>();
    if (backend["model"]) config->model = backend["model"].as<std::string>();
    if (backend["models"]) config->models = StringList(backend["models"]);
    if (backend["endpoint"]) config->endpoint = backend["endpoint"].as<std::string>();
    if (backend["access_token"]) config->access_token = backend["access_token"].as<std::string>();
    if (backend["timeout_seconds"]) {
      config->backend_timeout_seconds = backend["timeout_seconds"].as<int>();
    }
  }
  if (auto rate = root["rate_limit"]) {
    if (rate["enabled"]) config->rate_limit_enabled = rate["enabled"].as<bool>();
    if (rate["requests_per_minute"]) {
      config->requests_per_minute = rate["requests_per_minute"].as<int>();
    }
  }
  if (auto context = root["context"]) {
    if (context["max_tokens"]) config->max_context_tokens = context["max_tokens"].as<int>();
    if (context["preferred_tokens"]) {
      config->preferred_context_tokens = context["preferred_tokens"].as<int>();
    }
  }
  if (auto logging = root["logging"]) {
    if (logging["level"]) config->log_level = logging["level"].as<std::string>();
    if (logging["format"]) config->log_format = logging["format"].as<std::string>();
  }
  return true;
}

void ApplyEnvOverrides(GatewayConfig *config, const EnvLookup &env) {
  auto lookup = [&](const char *name) -> const char * {
    return env ? env(name) : std::getenv(name);
  };

  if (const char *v = lookup("VERTEXBRIDGE_HOST")) config->host = v;
  if (const char *v = lookup("VERTEXBRIDGE_PORT")) {
    config->port = ParseInt("VERTEXBRIDGE_PORT", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_HTTP_WORKERS")) {
    config->http_workers = ParseInt("VERTEXBRIDGE_HTTP_WORKERS", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_CORS_ORIGINS")) {
    config->cors_origins = SplitList(v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_TLS_ENABLED")) {
    config->tls_enabled = ParseBool(v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_TLS_CERT_PATH")) config->tls_cert_path = v;
  if (const char *v = lookup("VERTEXBRIDGE_TLS_KEY_PATH")) config->tls_key_path = v;

  if (const char *v = lookup("VERTEXBRIDGE_GCP_PROJECT_ID")) config->project_id = v;
  if (const char *v = lookup("VERTEXBRIDGE_GCP_REGION")) config->region = v;
  if (const char *v = lookup("VERTEXBRIDGE_MODEL_NAME")) config->model = v;
  if (const char *v = lookup("VERTEXBRIDGE_MODELS")) config->models = SplitList(v);
  if (const char *v = lookup("VERTEXBRIDGE_BACKEND_ENDPOINT")) config->endpoint = v;
  if (const char *v = lookup("VERTEXBRIDGE_BACKEND_TIMEOUT")) {
    config->backend_timeout_seconds = ParseInt("VERTEXBRIDGE_BACKEND_TIMEOUT", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_ACCESS_TOKEN")) {
    config->access_token = v;
  } else if (config->access_token.empty()) {
    if (const char *g = lookup("GOOGLE_OAUTH_ACCESS_TOKEN")) {
      config->access_token = g;
    }
  }

  if (const char *v = lookup("VERTEXBRIDGE_RATE_LIMIT_ENABLED")) {
    config->rate_limit_enabled = ParseBool(v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_RATE_LIMIT_RPM")) {
    config->requests_per_minute = ParseInt("VERTEXBRIDGE_RATE_LIMIT_RPM", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_MAX_CONTEXT_SIZE")) {
    config->max_context_tokens = ParseInt("VERTEXBRIDGE_MAX_CONTEXT_SIZE", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_PREFERRED_CONTEXT_SIZE")) {
    config->preferred_context_tokens =
        ParseInt("VERTEXBRIDGE_PREFERRED_CONTEXT_SIZE", v);
  }
  if (const char *v = lookup("VERTEXBRIDGE_LOG_LEVEL")) config->log_level = v;
  if (const char *v = lookup("VERTEXBRIDGE_LOG_FORMAT")) config->log_format = ToLower(v);
}

void ValidateConfig(const GatewayConfig &config) {
  if (config.port <= 0 || config.port > 65535) {
    throw std::invalid_argument("server.http_port must be in 1..65535");
  }
  if (config.http_workers <= 0) {
    throw std::invalid_argument("server.workers must be positive");
  }
  if (config.preferred_context_tokens <= 0 ||
      config.preferred_context_tokens > config.max_context_tokens) {
    throw std::invalid_argument(
        "context budget requires 0 < preferred_tokens <= max_tokens");
  }
  if (config.CatalogIds().empty()) {
    throw std::invalid_argument("backend.model must name at least one model");
  }
  if (config.backend_timeout_seconds <= 0) {
    throw std::invalid_argument("backend.timeout_seconds must be positive");
  }
  if (config.tls_enabled &&
      (config.tls_cert_path.empty() || config.tls_key_path.empty())) {
    throw std::invalid_argument("tls.enabled requires cert_path and key_path");
  }
}

GatewayConfig LoadGatewayConfig(const std::string &path,
                                const EnvLookup &env) {
  GatewayConfig config;
  if (!LoadConfigFile(path, &config)) {
    log::Info("config", "config file not found, using defaults",
              "path=" + path);
  }
  ApplyEnvOverrides(&config, env);
  ValidateConfig(config);
  return config;
}

} // namespace vertexbridge
