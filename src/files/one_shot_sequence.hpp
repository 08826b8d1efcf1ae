#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace gpcam::files {

// Finite, single-pass result of one listing call.
//
// Each element is handed out exactly once; after the last one the sequence
// stays empty. Callers that need a second pass issue a new listing.
template <typename T>
class OneShotSequence {
public:
  OneShotSequence() = default;
  explicit OneShotSequence(std::vector<T> items) : items_(std::move(items)) {}

  OneShotSequence(const OneShotSequence&) = delete;
  OneShotSequence& operator=(const OneShotSequence&) = delete;
  OneShotSequence(OneShotSequence&&) = default;
  OneShotSequence& operator=(OneShotSequence&&) = default;

  // Moves the next element into `item`; false once exhausted.
  bool Next(T& item) {
    if (cursor_ >= items_.size()) {
      return false;
    }
    item = std::move(items_[cursor_]);
    ++cursor_;
    if (cursor_ == items_.size()) {
      items_.clear();
      cursor_ = 0;
    }
    return true;
  }

  // Consumes whatever is left.
  std::vector<T> Drain() {
    std::vector<T> rest;
    rest.reserve(remaining());
    for (std::size_t i = cursor_; i < items_.size(); ++i) {
      rest.push_back(std::move(items_[i]));
    }
    items_.clear();
    cursor_ = 0;
    return rest;
  }

  std::size_t remaining() const {
    return items_.size() - cursor_;
  }

  bool exhausted() const {
    return remaining() == 0U;
  }

private:
  std::vector<T> items_;
  std::size_t cursor_ = 0;
};

} // namespace gpcam::files
