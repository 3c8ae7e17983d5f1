#include "gateway/model_catalog.h"

#include <algorithm>
#include <stdexcept>

namespace vertexbridge {

ModelCatalog::ModelCatalog(const std::vector<std::string> &ids) {
  for (const auto &id : ids) {
    if (id.empty() || Supports(id)) {
      continue;
    }
    ids_.push_back(id);
  }
  if (ids_.empty()) {
    throw std::invalid_argument("model catalog requires at least one model");
  }
}

bool ModelCatalog::Supports(const std::string &model) const {
  return std::find(ids_.begin(), ids_.end(), model) != ids_.end();
}

} // namespace vertexbridge
