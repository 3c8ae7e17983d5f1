#pragma once

#include "backend/backend_client.h"
#include "gateway/chat_types.h"
#include "gateway/model_catalog.h"

#include <optional>
#include <string>

namespace vertexbridge {

// Maps a trimmed conversation onto the backend's native request shape.
// Pure; the catalog is only read.
class RequestTranslator {
public:
  explicit RequestTranslator(const ModelCatalog &catalog)
      : catalog_(catalog) {}

  // Throws GatewayError(kInvalidModel) when `model` is not in the catalog.
  BackendRequest Translate(const TrimmedContext &context,
                           const std::string &model,
                           std::optional<double> temperature,
                           std::optional<int> max_output_tokens) const;

  // Same, also carrying top_p and stop sequences from the request.
  BackendRequest Translate(const TrimmedContext &context,
                           const ChatRequest &request) const;

private:
  const ModelCatalog &catalog_;
};

} // namespace vertexbridge
