#pragma once

#include "gateway/chat_types.h"

#include <string>

namespace vertexbridge {

// Parses and validates an OpenAI-style chat-completion body.
//
// Sampling parameters may appear at the top level or inside a nested
// "parameters" object; top-level values win. `path_model` (from
// /v1/models/{id}/chat) overrides the body's "model"; `default_model` is used
// when neither names one.
//
// Throws GatewayError(kInvalidRequest) with the offending parameter name.
ChatRequest ParseChatRequest(const std::string &body,
                             const std::string &default_model,
                             const std::string &path_model = {});

} // namespace vertexbridge
