#include "backend/backend_client.h"

namespace vertexbridge {

BackendFinishReason ParseBackendFinishReason(const std::string &name) {
  if (name == "STOP") {
    return BackendFinishReason::kStop;
  }
  if (name == "MAX_TOKENS") {
    return BackendFinishReason::kMaxTokens;
  }
  if (name == "SAFETY" || name == "IMAGE_SAFETY") {
    return BackendFinishReason::kSafety;
  }
  if (name == "RECITATION") {
    return BackendFinishReason::kRecitation;
  }
  if (name == "BLOCKLIST") {
    return BackendFinishReason::kBlocklist;
  }
  if (name == "PROHIBITED_CONTENT") {
    return BackendFinishReason::kProhibitedContent;
  }
  if (name == "SPII") {
    return BackendFinishReason::kSpii;
  }
  if (name == "MALFORMED_FUNCTION_CALL") {
    return BackendFinishReason::kMalformedFunctionCall;
  }
  if (name == "FINISH_REASON_UNSPECIFIED" || name.empty()) {
    return BackendFinishReason::kUnspecified;
  }
  return BackendFinishReason::kOther;
}

} // namespace vertexbridge
