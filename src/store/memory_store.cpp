// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "store/memory_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace timechunk {
namespace store {

namespace {

// Store file format. 2: records carry their kind, tags are hex.
constexpr int kStoreFileVersion = 2;

std::string TagToHex(const std::string &tag) {
  return util::HexStr(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(tag.data()), tag.size()));
}

} // namespace

MemoryStore::MemoryStore() = default;
MemoryStore::~MemoryStore() = default;

std::optional<EntryHash> MemoryStore::Put(const Entry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);

  EntryHash hash = entry.GetHash();
  auto [it, inserted] = m_entries.try_emplace(hash, entry);
  if (inserted) {
    LOG_STORE_TRACE("Put: stored {} entry {}", EntryTypeToString(entry.type),
                    hash.ToString().substr(0, 16));
  } else {
    LOG_STORE_TRACE("Put: entry {} already stored", hash.ToString().substr(0, 16));
  }
  return hash;
}

std::optional<Entry> MemoryStore::Get(const EntryHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = m_entries.find(hash);
  if (it == m_entries.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryStore::Has(const EntryHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return m_entries.count(hash) > 0;
}

bool MemoryStore::CommitLink(const LinkRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return CommitLinkLocked(record);
}

bool MemoryStore::CommitLinkLocked(const LinkRecord &record) {
  auto &history = m_histories[record.author];

  if (record.author_sequence < history.size()) {
    if (history[record.author_sequence] == record) {
      // Identical record already committed
      return true;
    }
    LOG_STORE_WARN("CommitLink: author {} already has a different record at "
                   "sequence {}",
                   record.author.ToString().substr(0, 16),
                   record.author_sequence);
    return false;
  }

  if (record.author_sequence != history.size()) {
    LOG_STORE_WARN("CommitLink: author {} sequence gap (expected {}, got {})",
                   record.author.ToString().substr(0, 16), history.size(),
                   record.author_sequence);
    return false;
  }

  history.push_back(record);
  m_links[record.source].push_back(record);
  ++m_link_count;

  LOG_STORE_TRACE("CommitLink: {}", record.ToString());
  return true;
}

std::vector<LinkRecord> MemoryStore::GetLinksFrom(const EntryHash &base) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = m_links.find(base);
  if (it == m_links.end()) {
    return {};
  }
  return it->second;
}

std::vector<LinkRecord> MemoryStore::GetHistory(const AgentId &author) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = m_histories.find(author);
  if (it == m_histories.end()) {
    return {};
  }
  return it->second;
}

uint64_t MemoryStore::NextSequence(const AgentId &author) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = m_histories.find(author);
  if (it == m_histories.end()) {
    return 0;
  }
  return it->second.size();
}

size_t MemoryStore::GetEntryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return m_entries.size();
}

size_t MemoryStore::GetLinkCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return m_link_count;
}

bool MemoryStore::Save(const std::string &filepath) const {
  using json = nlohmann::json;
  std::lock_guard<std::mutex> lock(mutex_);

  try {
    LOG_STORE_DEBUG("Saving {} entries and {} links to {}", m_entries.size(),
                    m_link_count, filepath);

    json root;
    root["version"] = kStoreFileVersion;

    json entries = json::array();
    for (const auto &[hash, entry] : m_entries) {
      json entry_data;
      entry_data["hash"] = hash.ToString();
      entry_data["type"] = static_cast<int>(entry.type);
      entry_data["payload"] = util::HexStr(entry.payload);
      entries.push_back(entry_data);
    }
    root["entries"] = entries;

    json authors = json::array();
    for (const auto &[author, history] : m_histories) {
      json author_data;
      author_data["author"] = author.ToString();
      json records = json::array();
      for (const auto &record : history) {
        json record_data;
        record_data["sequence"] = record.author_sequence;
        record_data["kind"] = static_cast<int>(record.kind);
        record_data["chunk"] = record.chunk.ToString();
        record_data["source"] = record.source.ToString();
        record_data["target"] = record.target.ToString();
        record_data["tag"] = TagToHex(record.tag);
        records.push_back(record_data);
      }
      author_data["records"] = records;
      authors.push_back(author_data);
    }
    root["authors"] = authors;

    if (!util::atomic_write_file(filepath, root.dump(2))) {
      LOG_STORE_ERROR("Failed to write store file: {}", filepath);
      return false;
    }
    return true;

  } catch (const std::exception &e) {
    LOG_STORE_ERROR("Exception during Save: {}", e.what());
    return false;
  }
}

bool MemoryStore::Load(const std::string &filepath) {
  using json = nlohmann::json;
  std::lock_guard<std::mutex> lock(mutex_);

  auto reset = [this]() {
    m_entries.clear();
    m_links.clear();
    m_histories.clear();
    m_link_count = 0;
  };

  try {
    std::ifstream file(filepath);
    if (!file.is_open()) {
      LOG_STORE_DEBUG("Store file not found: {} (starting fresh)", filepath);
      return false;
    }

    json root;
    file >> root;

    int version = root.value("version", 0);
    if (version != kStoreFileVersion) {
      LOG_STORE_ERROR("Unsupported store file version: {}", version);
      return false;
    }

    reset();

    for (const auto &entry_data : root.at("entries")) {
      auto type = EntryTypeFromByte(
          static_cast<uint8_t>(entry_data.at("type").get<int>()));
      if (!type) {
        LOG_STORE_ERROR("Unknown entry type in store file");
        reset();
        return false;
      }

      auto payload =
          util::TryParseHex(entry_data.at("payload").get<std::string>());
      if (!payload) {
        LOG_STORE_ERROR("Malformed entry payload in store file");
        reset();
        return false;
      }
      Entry entry;
      entry.type = *type;
      entry.payload = std::move(*payload);

      // Content addressing: the stored hash must match the content
      EntryHash expected;
      if (!expected.SetHex(entry_data.at("hash").get<std::string>()) ||
          expected != entry.GetHash()) {
        LOG_STORE_ERROR("Entry hash mismatch in store file: {}",
                        entry_data.at("hash").get<std::string>());
        reset();
        return false;
      }
      m_entries.emplace(expected, std::move(entry));
    }

    for (const auto &author_data : root.at("authors")) {
      AgentId author;
      if (!author.SetHex(author_data.at("author").get<std::string>())) {
        LOG_STORE_ERROR("Malformed author id in store file");
        reset();
        return false;
      }

      for (const auto &record_data : author_data.at("records")) {
        LinkRecord record;
        record.author = author;
        record.author_sequence = record_data.at("sequence").get<uint64_t>();

        const int kind = record_data.at("kind").get<int>();
        auto tag = util::TryParseHex(record_data.at("tag").get<std::string>());
        if (kind != static_cast<int>(LinkKind::DIRECT) &&
            kind != static_cast<int>(LinkKind::CHAINED)) {
          LOG_STORE_ERROR("Unknown link kind {} in store file", kind);
          reset();
          return false;
        }
        record.kind = static_cast<LinkKind>(kind);
        if (tag) {
          record.tag.assign(tag->begin(), tag->end());
        }

        if (!tag ||
            !record.chunk.SetHex(record_data.at("chunk").get<std::string>()) ||
            !record.source.SetHex(record_data.at("source").get<std::string>()) ||
            !record.target.SetHex(record_data.at("target").get<std::string>()) ||
            record.tag.size() > LinkRecord::MAX_TAG_SIZE) {
          LOG_STORE_ERROR("Malformed link record in store file");
          reset();
          return false;
        }
        if (!CommitLinkLocked(record)) {
          LOG_STORE_ERROR("Author history in store file is not contiguous: {}",
                          author.ToString());
          reset();
          return false;
        }
      }
    }

    LOG_STORE_INFO("Loaded {} entries and {} links from {}", m_entries.size(),
                   m_link_count, filepath);
    return true;

  } catch (const std::exception &e) {
    LOG_STORE_ERROR("Exception during Load: {}", e.what());
    reset();
    return false;
  }
}

} // namespace store
} // namespace timechunk
