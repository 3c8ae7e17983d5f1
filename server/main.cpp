#include "backend/vertex_client.h"
#include "gateway/chat_service.h"
#include "gateway/model_catalog.h"
#include "server/auth/rate_limiter.h"
#include "server/config/gateway_config.h"
#include "server/http/http_server.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
constexpr char kVersion[] = "0.1.0";

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

std::string JoinIds(const std::vector<std::string> &ids) {
  std::string joined;
  for (const auto &id : ids) {
    joined += (joined.empty() ? "" : ",") + id;
  }
  return joined;
}
} // namespace

int main(int argc, char **argv) {
  std::string config_path = "config/server.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: vertexbridge [--config PATH]" << std::endl;
      return 0;
    }
  }

  if (const char *fmt = std::getenv("VERTEXBRIDGE_LOG_FORMAT")) {
    vertexbridge::log::SetJsonMode(std::string(fmt) == "json");
  }

  vertexbridge::GatewayConfig config;
  try {
    config = vertexbridge::LoadGatewayConfig(config_path);
  } catch (const YAML::Exception &e) {
    vertexbridge::log::Error("config", "failed to parse config file",
                             "path=" + config_path + " error=" + e.what());
    return 1;
  } catch (const std::invalid_argument &e) {
    vertexbridge::log::Error("config", "invalid configuration", e.what());
    return 1;
  }
  vertexbridge::log::SetJsonMode(config.log_format == "json");
  vertexbridge::log::SetMinLevel(vertexbridge::log::ParseLevel(config.log_level));

  if (config.project_id.empty()) {
    vertexbridge::log::Warn("config", "backend.project_id is not set; backend "
                                      "calls will fail");
  }
  if (config.access_token.empty()) {
    vertexbridge::log::Warn("config", "no backend access token configured; "
                                      "set VERTEXBRIDGE_ACCESS_TOKEN");
  }

  vertexbridge::ModelCatalog catalog(config.CatalogIds());

  vertexbridge::VertexClientConfig vertex_config;
  vertex_config.project_id = config.project_id;
  vertex_config.region = config.region;
  vertex_config.endpoint = config.endpoint;
  vertex_config.access_token = config.access_token;
  vertex_config.timeout = std::chrono::seconds(config.backend_timeout_seconds);
  vertexbridge::VertexClient backend(vertex_config);

  auto &metrics = vertexbridge::GlobalMetrics();
  metrics.SetBackend(backend.Name());

  vertexbridge::RateLimiter rate_limiter(config.EffectiveRateLimit());
  vertexbridge::TokenBudget budget{config.preferred_context_tokens,
                                   config.max_context_tokens};
  vertexbridge::ChatService service(backend, catalog, rate_limiter, budget,
                                    &metrics);

  vertexbridge::HttpServer::ServerInfo info;
  info.version = kVersion;
  info.project_id = config.project_id;
  info.region = config.region;
  info.rate_limit = config.EffectiveRateLimit();
  info.cors_origins = config.cors_origins;
  vertexbridge::log::SetAppName(info.name);

  vertexbridge::HttpServer::TlsConfig tls_config;
  tls_config.enabled = config.tls_enabled;
  tls_config.cert_path = config.tls_cert_path;
  tls_config.key_path = config.tls_key_path;

  std::unique_ptr<vertexbridge::HttpServer> server;
  try {
    server = std::make_unique<vertexbridge::HttpServer>(
        config.host, config.port, &service, &metrics, info, tls_config,
        config.http_workers);
  } catch (const std::exception &e) {
    vertexbridge::log::Error("server", "failed to start", e.what());
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  vertexbridge::log::Info("server", "starting vertexbridge",
                          std::string("version=") + kVersion);
  vertexbridge::log::Info("server", "model",
                          "default=" + catalog.DefaultModel() +
                              " catalog=" + JoinIds(catalog.Ids()));
  vertexbridge::log::Info("server", "backend",
                          "project=" + config.project_id +
                              " region=" + config.region +
                              " base=" + backend.BaseUrl());
  vertexbridge::log::Info(
      "server", "rate limit",
      rate_limiter.Enabled()
          ? std::to_string(rate_limiter.CurrentLimit()) + " RPM"
          : std::string("disabled"));
  vertexbridge::log::Info("server", "context window",
                          "preferred=" + std::to_string(budget.preferred) +
                              " max=" + std::to_string(budget.maximum));

  server->Start();
  vertexbridge::log::Info("server", "listening",
                          config.host + ":" + std::to_string(config.port) +
                              (config.tls_enabled ? " (TLS)" : ""));

  while (g_running && server->Running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server->Stop();
  vertexbridge::log::Info("server", "shutting down");
  return 0;
}
