// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "index/chunk_range.hpp"
#include "validation/validation.hpp"
#include <algorithm>
#include <utility>

namespace timechunk {
namespace index {

ChunkRange::Iterator::Iterator(const chunk::ChunkManager *manager,
                               std::string name, int64_t next, int64_t last)
    : manager_(manager), name_(std::move(name)), next_(next), last_(last) {
  Advance();
}

void ChunkRange::Iterator::Advance() {
  current_.reset();
  if (!manager_) {
    return;
  }
  while (next_ <= last_) {
    const int64_t index = next_;
    // last_ <= MaxChunkIndex, so next_ cannot overflow
    ++next_;

    validation::ValidationState state;
    auto found = manager_->FetchChunk(name_, index, state);
    if (found) {
      current_ = std::move(found);
      return;
    }
  }
  manager_ = nullptr;
}

ChunkRange::ChunkRange(const chunk::ChunkManager &manager, std::string name,
                       int64_t first, int64_t last)
    : manager_(&manager), name_(std::move(name)),
      first_(std::max<int64_t>(first, 0)),
      last_(std::min(last, chunk::MaxChunkIndex(manager.GetParams()))) {}

ChunkRange::Iterator ChunkRange::begin() const {
  if (!manager_ || first_ > last_) {
    return Iterator();
  }
  return Iterator(manager_, name_, first_, last_);
}

std::vector<chunk::Chunk> ChunkRange::ToVector() const {
  return std::vector<chunk::Chunk>(begin(), end());
}

} // namespace index
} // namespace timechunk
