// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "primitives/link.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <sstream>

namespace timechunk {

namespace {
// Prefix for record hashes; never a valid EntryType byte
constexpr uint8_t kLinkHashDomain = 0x80;

constexpr size_t OFF_AUTHOR = 0;
constexpr size_t OFF_SEQUENCE = 32;
constexpr size_t OFF_KIND = 40;
constexpr size_t OFF_CHUNK = 41;
constexpr size_t OFF_SOURCE = 73;
constexpr size_t OFF_TARGET = 105;
constexpr size_t OFF_TAG_LEN = 137;

static_assert(OFF_TAG_LEN + 4 == LinkRecord::FIXED_SIZE,
              "LinkRecord FIXED_SIZE mismatch");
} // namespace

std::string LinkKindToString(LinkKind kind) {
  switch (kind) {
  case LinkKind::DIRECT:
    return "direct";
  case LinkKind::CHAINED:
    return "chained";
  }
  return "unknown";
}

EntryHash LinkRecord::GetHash() const {
  const auto bytes = Serialize();
  return crypto::CSHA256()
      .Write(&kLinkHashDomain, 1)
      .Write(bytes.data(), bytes.size())
      .Finalize();
}

std::vector<uint8_t> LinkRecord::Serialize() const {
  std::vector<uint8_t> data(FIXED_SIZE + tag.size());

  std::copy(author.begin(), author.end(), data.begin() + OFF_AUTHOR);
  endian::WriteLE64(data.data() + OFF_SEQUENCE, author_sequence);
  data[OFF_KIND] = static_cast<uint8_t>(kind);
  std::copy(chunk.begin(), chunk.end(), data.begin() + OFF_CHUNK);
  std::copy(source.begin(), source.end(), data.begin() + OFF_SOURCE);
  std::copy(target.begin(), target.end(), data.begin() + OFF_TARGET);
  endian::WriteLE32(data.data() + OFF_TAG_LEN, static_cast<uint32_t>(tag.size()));
  std::copy(tag.begin(), tag.end(), data.begin() + FIXED_SIZE);

  return data;
}

bool LinkRecord::Deserialize(const uint8_t *data, size_t size) {
  if (size < FIXED_SIZE) {
    return false;
  }

  const uint32_t tag_len = endian::ReadLE32(data + OFF_TAG_LEN);
  if (tag_len > MAX_TAG_SIZE || size != FIXED_SIZE + tag_len) {
    return false;
  }

  const uint8_t kind_byte = data[OFF_KIND];
  if (kind_byte != static_cast<uint8_t>(LinkKind::DIRECT) &&
      kind_byte != static_cast<uint8_t>(LinkKind::CHAINED)) {
    return false;
  }

  std::copy(data + OFF_AUTHOR, data + OFF_AUTHOR + 32, author.begin());
  author_sequence = endian::ReadLE64(data + OFF_SEQUENCE);
  kind = static_cast<LinkKind>(kind_byte);
  std::copy(data + OFF_CHUNK, data + OFF_CHUNK + 32, chunk.begin());
  std::copy(data + OFF_SOURCE, data + OFF_SOURCE + 32, source.begin());
  std::copy(data + OFF_TARGET, data + OFF_TARGET + 32, target.begin());
  tag.assign(reinterpret_cast<const char *>(data + FIXED_SIZE), tag_len);

  return true;
}

std::string LinkRecord::ToString() const {
  std::stringstream s;
  s << "LinkRecord(";
  s << "author=" << author.GetHex().substr(0, 16);
  s << ", seq=" << author_sequence;
  s << ", chunk=" << chunk.GetHex().substr(0, 16);
  s << ", " << LinkKindToString(kind);
  s << ", source=" << source.GetHex().substr(0, 16);
  s << ", target=" << target.GetHex().substr(0, 16);
  s << ", tag_len=" << tag.size() << ")";
  return s.str();
}

} // namespace timechunk
