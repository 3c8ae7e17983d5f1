#include "gateway/chat_request.h"

#include "gateway/errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace vertexbridge {

namespace {

[[noreturn]] void Invalid(const std::string &message,
                          const std::string &param) {
  throw GatewayError(ErrorKind::kInvalidRequest, message, param);
}

// Looks a sampling parameter up at the top level first, then in
// "parameters".
const json *FindParam(const json &root, const char *key) {
  if (root.contains(key) && !root[key].is_null()) {
    return &root[key];
  }
  if (root.contains("parameters") && root["parameters"].is_object()) {
    const auto &params = root["parameters"];
    if (params.contains(key) && !params[key].is_null()) {
      return &params[key];
    }
  }
  return nullptr;
}

std::string ParseContent(const json &content, const std::string &param) {
  if (content.is_string()) {
    return content.get<std::string>();
  }
  if (!content.is_array()) {
    Invalid("message content must be a string or an array of parts", param);
  }
  std::string text;
  for (const auto &part : content) {
    if (part.is_string()) {
      text += part.get<std::string>();
      continue;
    }
    if (!part.is_object() || !part.contains("type") ||
        !part["type"].is_string()) {
      Invalid("content parts must be objects with a type", param);
    }
    if (part["type"].get<std::string>() != "text") {
      Invalid("unsupported content part type '" +
                  part["type"].get<std::string>() + "'",
              param);
    }
    if (!part.contains("text") || !part["text"].is_string()) {
      Invalid("text content part requires a 'text' string", param);
    }
    text += part["text"].get<std::string>();
  }
  return text;
}

} // namespace

ChatRequest ParseChatRequest(const std::string &body,
                             const std::string &default_model,
                             const std::string &path_model) {
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error &ex) {
    Invalid(std::string("request body is not valid JSON: ") + ex.what(), "");
  }
  if (!root.is_object()) {
    Invalid("request body must be a JSON object", "");
  }

  ChatRequest request;

  if (!path_model.empty()) {
    request.model = path_model;
  } else if (root.contains("model") && !root["model"].is_null()) {
    if (!root["model"].is_string()) {
      Invalid("model must be a string", "model");
    }
    request.model = root["model"].get<std::string>();
  }
  if (request.model.empty()) {
    request.model = default_model;
  }

  if (!root.contains("messages") || !root["messages"].is_array()) {
    Invalid("messages must be an array", "messages");
  }
  const auto &messages = root["messages"];
  if (messages.empty()) {
    Invalid("messages must not be empty", "messages");
  }
  for (std::size_t i = 0; i < messages.size(); ++i) {
    const auto &msg = messages[i];
    std::string param = "messages[" + std::to_string(i) + "]";
    if (!msg.is_object()) {
      Invalid("each message must be an object", param);
    }
    if (!msg.contains("role") || !msg["role"].is_string()) {
      Invalid("message role must be a string", param + ".role");
    }
    Role role;
    if (!ParseRole(msg["role"].get<std::string>(), &role)) {
      Invalid("unsupported role '" + msg["role"].get<std::string>() + "'",
              param + ".role");
    }
    if (!msg.contains("content") || msg["content"].is_null()) {
      Invalid("message content is required", param + ".content");
    }
    request.messages.emplace_back(role,
                                  ParseContent(msg["content"], param + ".content"));
  }

  if (const json *temperature = FindParam(root, "temperature")) {
    if (!temperature->is_number()) {
      Invalid("temperature must be a number", "temperature");
    }
    double value = temperature->get<double>();
    if (value < 0.0 || value > 2.0) {
      Invalid("temperature must be between 0 and 2", "temperature");
    }
    request.temperature = value;
  }

  if (const json *top_p = FindParam(root, "top_p")) {
    if (!top_p->is_number()) {
      Invalid("top_p must be a number", "top_p");
    }
    double value = top_p->get<double>();
    if (value < 0.0 || value > 1.0) {
      Invalid("top_p must be between 0 and 1", "top_p");
    }
    request.top_p = value;
  }

  if (const json *max_tokens = FindParam(root, "max_tokens")) {
    constexpr auto kMaxTokens =
        static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    bool in_range = false;
    if (max_tokens->is_number_unsigned()) {
      auto value = max_tokens->get<std::uint64_t>();
      in_range = value > 0 && value <= kMaxTokens;
    } else if (max_tokens->is_number_integer()) {
      auto value = max_tokens->get<std::int64_t>();
      in_range = value > 0 && static_cast<std::uint64_t>(value) <= kMaxTokens;
    }
    if (!in_range) {
      Invalid("max_tokens must be a positive integer", "max_tokens");
    }
    request.max_output_tokens = max_tokens->get<int>();
  }

  if (const json *stop = FindParam(root, "stop")) {
    if (stop->is_string()) {
      request.stop.push_back(stop->get<std::string>());
    } else if (stop->is_array()) {
      for (const auto &item : *stop) {
        if (!item.is_string()) {
          Invalid("stop must be a string or an array of strings", "stop");
        }
        request.stop.push_back(item.get<std::string>());
      }
    } else {
      Invalid("stop must be a string or an array of strings", "stop");
    }
  }

  if (root.contains("stream") && !root["stream"].is_null()) {
    if (!root["stream"].is_boolean()) {
      Invalid("stream must be a boolean", "stream");
    }
    request.stream = root["stream"].get<bool>();
  }

  return request;
}

} // namespace vertexbridge
