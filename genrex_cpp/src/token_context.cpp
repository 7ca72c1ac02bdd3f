#include "token_context.hpp"

#include <algorithm>
#include <utility>

namespace genrex {

void GenerationContext::record_capture(size_t group, std::string text) {
  captures_[group] = std::move(text);
}

const std::string* GenerationContext::capture(size_t group) const {
  auto it = captures_.find(group);
  if (it == captures_.end()) return nullptr;
  return &it->second;
}

void GenerationContext::add_unresolved(size_t group) {
  unresolved_.push_back(UnresolvedRef{cursor_, group});
}

std::vector<size_t> GenerationContext::resolve(std::string& text) const {
  std::vector<size_t> missing;
  // Positions are recorded in walk order, so they never decrease. Splicing
  // from the back keeps every earlier position valid.
  for (auto it = unresolved_.rbegin(); it != unresolved_.rend(); ++it) {
    const std::string* cap = capture(it->group);
    if (!cap) {
      if (std::find(missing.begin(), missing.end(), it->group) == missing.end()) missing.push_back(it->group);
      continue;
    }
    size_t pos = std::min(it->position, text.size());
    text.insert(pos, *cap);
  }
  return missing;
}

}  // namespace genrex
