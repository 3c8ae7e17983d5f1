#include "gateway/request_translator.h"

#include "gateway/errors.h"

namespace vertexbridge {

BackendRequest
RequestTranslator::Translate(const TrimmedContext &context,
                             const std::string &model,
                             std::optional<double> temperature,
                             std::optional<int> max_output_tokens) const {
  if (!catalog_.Supports(model)) {
    throw GatewayError(ErrorKind::kInvalidModel,
                       "Model '" + model + "' not found", "model");
  }

  BackendRequest out;
  out.model = model;
  out.temperature = temperature;
  out.max_output_tokens = max_output_tokens;

  const auto &messages = context.messages;
  std::size_t first_turn = 0;
  // The backend rejects a request without contents, so a lone system
  // message is sent as a user turn instead of a system instruction.
  if (messages.size() > 1 && messages.front().role() == Role::kSystem) {
    out.system_instruction = messages.front().content();
    first_turn = 1;
  }
  out.contents.reserve(messages.size() - first_turn);
  for (std::size_t i = first_turn; i < messages.size(); ++i) {
    const auto &message = messages[i];
    BackendContent content;
    content.role = message.role() == Role::kAssistant ? "model" : "user";
    content.text = message.content();
    out.contents.push_back(std::move(content));
  }
  return out;
}

BackendRequest RequestTranslator::Translate(const TrimmedContext &context,
                                            const ChatRequest &request) const {
  auto out = Translate(context, request.model, request.temperature,
                       request.max_output_tokens);
  out.top_p = request.top_p;
  out.stop_sequences = request.stop;
  return out;
}

} // namespace vertexbridge
