#pragma once

#include <string>
#include <vector>

namespace vertexbridge {

// Set of model identifiers the gateway forwards to the backend. The first
// entry is the default used when a request names no model.
class ModelCatalog {
public:
  // Throws std::invalid_argument when ids is empty. Duplicates and empty ids
  // are dropped.
  explicit ModelCatalog(const std::vector<std::string> &ids);

  bool Supports(const std::string &model) const;
  const std::string &DefaultModel() const { return ids_.front(); }
  const std::vector<std::string> &Ids() const { return ids_; }

private:
  std::vector<std::string> ids_;
};

} // namespace vertexbridge
