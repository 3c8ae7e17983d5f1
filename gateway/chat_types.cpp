#include "gateway/chat_types.h"

namespace vertexbridge {

const char *RoleName(Role role) {
  switch (role) {
  case Role::kSystem:
    return "system";
  case Role::kUser:
    return "user";
  case Role::kAssistant:
    return "assistant";
  }
  return "user";
}

bool ParseRole(const std::string &name, Role *role) {
  if (name == "system") {
    *role = Role::kSystem;
  } else if (name == "user") {
    *role = Role::kUser;
  } else if (name == "assistant") {
    *role = Role::kAssistant;
  } else {
    return false;
  }
  return true;
}

const char *FinishReasonName(FinishReason reason) {
  switch (reason) {
  case FinishReason::kStop:
    return "stop";
  case FinishReason::kLength:
    return "length";
  case FinishReason::kContentFilter:
    return "content_filter";
  }
  return "stop";
}

} // namespace vertexbridge
