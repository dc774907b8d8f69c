// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_INDEX_CHUNK_RANGE_HPP
#define TIMECHUNK_INDEX_CHUNK_RANGE_HPP

#include "chunk/chunk.hpp"
#include "chunk/chunk_manager.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace timechunk {
namespace index {

/**
 * ChunkRange - committed chunks of one index name with index in
 * [first, last], ascending
 *
 * Lazy: each step of an iterator probes the store for the next index until
 * it finds a committed chunk. Unused windows and entries that fail the
 * window check are skipped. Restartable: every begin() starts a fresh scan
 * against the store as it is at that moment.
 *
 * The range borrows the ChunkManager; it must not outlive it.
 */
class ChunkRange {
public:
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = chunk::Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const chunk::Chunk *;
    using reference = const chunk::Chunk &;

    Iterator() = default;
    Iterator(const chunk::ChunkManager *manager, std::string name, int64_t next,
             int64_t last);

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    Iterator &operator++() {
      Advance();
      return *this;
    }
    Iterator operator++(int) {
      Iterator prev = *this;
      Advance();
      return prev;
    }

    bool operator==(const Iterator &other) const {
      if (!current_ || !other.current_) {
        return !current_ && !other.current_;
      }
      return current_->index == other.current_->index;
    }

  private:
    void Advance();

    const chunk::ChunkManager *manager_{nullptr};
    std::string name_;
    int64_t next_{0};
    int64_t last_{-1};
    std::optional<chunk::Chunk> current_;
  };

  // Empty range
  ChunkRange() = default;
  ChunkRange(const chunk::ChunkManager &manager, std::string name,
             int64_t first, int64_t last);

  Iterator begin() const;
  Iterator end() const { return Iterator(); }

  bool empty() const { return begin() == end(); }

  std::vector<chunk::Chunk> ToVector() const;

private:
  const chunk::ChunkManager *manager_{nullptr};
  std::string name_;
  int64_t first_{0};
  int64_t last_{-1};
};

} // namespace index
} // namespace timechunk

#endif // TIMECHUNK_INDEX_CHUNK_RANGE_HPP
