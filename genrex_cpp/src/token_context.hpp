#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace genrex {

constexpr size_t kDefaultMaxRepeat = 32;

// A back-reference met before its group produced text. `position` is the
// absolute output offset at which the referenced text belongs.
struct UnresolvedRef {
  size_t position = 0;
  size_t group = 0;
};

// Mutable state for one generation attempt. Created fresh per attempt and
// discarded afterwards.
class GenerationContext {
 public:
  explicit GenerationContext(size_t max_repeat = kDefaultMaxRepeat) : max_repeat_(max_repeat) {}

  // Extra repetitions allowed beyond `min` for an unbounded quantifier.
  size_t max_repeat() const { return max_repeat_; }

  size_t cursor() const { return cursor_; }
  void set_cursor(size_t pos) { cursor_ = pos; }

  // Last write wins: a group inside a repetition keeps its final completion.
  void record_capture(size_t group, std::string text);
  const std::string* capture(size_t group) const;
  size_t capture_count() const { return captures_.size(); }

  void add_unresolved(size_t group);
  const std::vector<UnresolvedRef>& unresolved() const { return unresolved_; }

  // Second pass over a finished walk: splices the final capture text of each
  // unresolved reference into `text` at its recorded position. Returns the
  // groups that never produced text; their references stay empty.
  std::vector<size_t> resolve(std::string& text) const;

 private:
  size_t max_repeat_;
  size_t cursor_ = 0;
  std::unordered_map<size_t, std::string> captures_;
  std::vector<UnresolvedRef> unresolved_;
};

}  // namespace genrex
