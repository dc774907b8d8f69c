// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include <fstream>
#include <openssl/rand.h>
#include <stdexcept>

namespace timechunk {
namespace app {

namespace {

int64_t ParseInt64(const std::string &text, const char *what) {
  size_t pos = 0;
  int64_t value = 0;
  try {
    value = std::stoll(text, &pos);
  } catch (const std::exception &) {
    throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
  }
  if (pos != text.size()) {
    throw std::invalid_argument(std::string("invalid ") + what + ": " + text);
  }
  return value;
}

std::optional<std::string> OptionalArg(const std::vector<std::string> &args,
                                       size_t pos) {
  if (args.size() > pos) {
    return args[pos];
  }
  return std::nullopt;
}

} // namespace

Application::Application(const AppConfig &config) : config_(config) {}

Application::~Application() { shutdown(); }

bool Application::initialize() {
  if (config_.index_name.size() > chunk::Chunk::MAX_NAME_SIZE) {
    LOG_APP_ERROR("Index name longer than {} bytes",
                  chunk::Chunk::MAX_NAME_SIZE);
    return false;
  }
  if (!init_params()) {
    LOG_APP_ERROR("Failed to initialize network parameters");
    return false;
  }
  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }
  if (!init_store()) {
    LOG_APP_ERROR("Failed to load store");
    return false;
  }
  if (!init_agent()) {
    LOG_APP_ERROR("Failed to initialize agent identity");
    return false;
  }

  index_ = std::make_unique<index::TimeIndex>(*params_, *store_, *store_, agent_);
  LOG_APP_DEBUG("Initialized {} index '{}' for agent {}", params_->GetName(),
                config_.index_name, agent_.ToString().substr(0, 16));
  return true;
}

bool Application::init_params() {
  if (!config_.params_file.empty()) {
    // Throws on malformed definitions; main reports it
    params_ = chunk::NetworkParams::LoadFromFile(config_.params_file);
    return true;
  }

  switch (config_.network_type) {
  case chunk::NetworkType::TESTNET:
    params_ = chunk::NetworkParams::CreateTestNet();
    break;
  case chunk::NetworkType::REGTEST:
    params_ = chunk::NetworkParams::CreateRegTest();
    break;
  case chunk::NetworkType::MAIN:
  case chunk::NetworkType::CUSTOM:
    params_ = chunk::NetworkParams::CreateMainNet();
    break;
  }
  return params_ != nullptr;
}

bool Application::init_datadir() {
  network_dir_ = config_.datadir;
  if (params_->GetNetworkType() != chunk::NetworkType::MAIN) {
    network_dir_ /= params_->GetName();
  }
  if (!util::ensure_directory(network_dir_)) {
    LOG_APP_ERROR("Cannot create data directory: {}", network_dir_.string());
    return false;
  }
  store_file_ = network_dir_ / "store.json";
  return true;
}

bool Application::init_store() {
  store_ = std::make_unique<store::MemoryStore>();
  if (!std::filesystem::exists(store_file_)) {
    LOG_APP_DEBUG("No store at {}, starting empty", store_file_.string());
    return true;
  }
  return store_->Load(store_file_.string());
}

bool Application::init_agent() {
  if (!config_.agent_hex.empty()) {
    auto parsed = uint256::FromHex(config_.agent_hex);
    if (!parsed) {
      LOG_APP_ERROR("Invalid agent id: {}", config_.agent_hex);
      return false;
    }
    agent_ = *parsed;
    return true;
  }

  const auto agent_file = network_dir_ / "agent";
  std::ifstream in(agent_file);
  if (in) {
    std::string hex;
    in >> hex;
    auto parsed = uint256::FromHex(hex);
    if (!parsed) {
      LOG_APP_ERROR("Corrupt agent file: {}", agent_file.string());
      return false;
    }
    agent_ = *parsed;
    return true;
  }

  // First run: create a persistent identity
  if (RAND_bytes(agent_.data(), static_cast<int>(agent_.size())) != 1) {
    LOG_APP_ERROR("RAND_bytes failed");
    return false;
  }
  if (!util::atomic_write_file(agent_file, agent_.ToString() + "\n")) {
    LOG_APP_ERROR("Failed to write agent file: {}", agent_file.string());
    return false;
  }
  LOG_APP_INFO("Created agent identity {}", agent_.ToString());
  return true;
}

bool Application::shutdown() {
  if (!dirty_ || !store_) {
    return true;
  }
  dirty_ = false;
  if (!store_->Save(store_file_.string())) {
    LOG_APP_ERROR("Failed to save store to {}", store_file_.string());
    return false;
  }
  return true;
}

nlohmann::json Application::run_command(const std::string &command,
                                        const std::vector<std::string> &args) {
  if (command == "add-link") {
    return cmd_add_link(args);
  } else if (command == "index") {
    return cmd_index(args);
  } else if (command == "current") {
    return cmd_current();
  } else if (command == "latest") {
    return cmd_latest();
  } else if (command == "span") {
    return cmd_span(args);
  } else if (command == "links") {
    return cmd_links(args);
  } else if (command == "params") {
    return params_->ToJson();
  }
  throw std::invalid_argument("unknown command: " + command);
}

nlohmann::json Application::cmd_add_link(const std::vector<std::string> &args) {
  if (args.empty()) {
    throw std::invalid_argument("add-link requires <target-hex>");
  }
  auto target = uint256::FromHex(args[0]);
  if (!target) {
    throw std::invalid_argument("invalid target hash: " + args[0]);
  }

  validation::ValidationState state;
  auto record = index_->AddLink(config_.index_name, *target,
                                OptionalArg(args, 1).value_or(""), state);
  if (!record) {
    return error_to_json(state);
  }
  dirty_ = true;
  return record_to_json(*record);
}

nlohmann::json Application::cmd_index(const std::vector<std::string> &args) {
  if (args.empty()) {
    throw std::invalid_argument("index requires <text>");
  }
  const int64_t when = args.size() > 1 ? ParseInt64(args[1], "time")
                                       : util::GetTime();

  validation::ValidationState state;
  auto record =
      index_->IndexEntry(config_.index_name, Entry::FromString(args[0]), when,
                         OptionalArg(args, 2).value_or(""), state);
  if (!record) {
    return error_to_json(state);
  }
  dirty_ = true;
  return record_to_json(*record);
}

nlohmann::json Application::cmd_current() {
  validation::ValidationState state;
  auto current =
      index_->GetCurrentIndex(config_.index_name, std::nullopt, state);
  if (!current) {
    if (!state.IsValid()) {
      return error_to_json(state);
    }
    return nlohmann::json{{"chunk", nullptr}};
  }
  nlohmann::json out = chunk_to_json(current->chunk);
  out["links"] = nlohmann::json::array();
  for (const auto &target : current->targets) {
    out["links"].push_back(target.ToString());
  }
  return out;
}

nlohmann::json Application::cmd_latest() {
  auto latest = index_->GetMostRecentIndex(config_.index_name, std::nullopt);
  if (!latest) {
    return nlohmann::json{{"chunk", nullptr}};
  }
  nlohmann::json out = chunk_to_json(latest->chunk);
  out["links"] = nlohmann::json::array();
  for (const auto &target : latest->targets) {
    out["links"].push_back(target.ToString());
  }
  return out;
}

nlohmann::json Application::cmd_span(const std::vector<std::string> &args) {
  if (args.size() < 2) {
    throw std::invalid_argument("span requires <from> <until>");
  }
  const int64_t from = ParseInt64(args[0], "from");
  const int64_t until = ParseInt64(args[1], "until");

  nlohmann::json out = nlohmann::json::array();
  for (const auto &chunk :
       index_->GetChunksForTimeSpan(config_.index_name, from, until)) {
    out.push_back(chunk_to_json(chunk));
  }
  return out;
}

nlohmann::json Application::cmd_links(const std::vector<std::string> &args) {
  if (args.empty()) {
    throw std::invalid_argument("links requires <chunk-index>");
  }
  const int64_t chunk_index = ParseInt64(args[0], "chunk index");

  validation::ValidationState state;
  auto chunk = index_->GetChunkManager().FetchChunk(config_.index_name,
                                                    chunk_index, state);
  if (!chunk) {
    if (!state.IsValid()) {
      return error_to_json(state);
    }
    return nlohmann::json{{"chunk", nullptr}};
  }

  nlohmann::json out = chunk_to_json(*chunk);
  out["records"] = nlohmann::json::array();
  for (const auto &record : index_->GetLinkRecords(*chunk)) {
    out["records"].push_back(record_to_json(record));
  }
  return out;
}

nlohmann::json Application::chunk_to_json(const chunk::Chunk &chunk) const {
  return nlohmann::json{{"name", chunk.name},
                        {"index", chunk.index},
                        {"start_time", chunk.start_time},
                        {"end_time", chunk.end_time},
                        {"start", util::FormatTime(chunk.start_time)},
                        {"hash", chunk.GetHash().ToString()}};
}

nlohmann::json Application::record_to_json(const LinkRecord &record) const {
  return nlohmann::json{{"hash", record.GetHash().ToString()},
                        {"author", record.author.ToString()},
                        {"sequence", record.author_sequence},
                        {"kind", LinkKindToString(record.kind)},
                        {"chunk", record.chunk.ToString()},
                        {"source", record.source.ToString()},
                        {"target", record.target.ToString()},
                        {"tag", record.tag},
                        {"tag_hex", util::HexStr(std::span<const uint8_t>(
                                        reinterpret_cast<const uint8_t *>(
                                            record.tag.data()),
                                        record.tag.size()))}};
}

nlohmann::json
Application::error_to_json(const validation::ValidationState &state) {
  return nlohmann::json{
      {"error", state.GetRejectReason()},
      {"code", validation::RejectCodeToString(state.GetRejectCode())},
      {"transient", state.IsError()},
      {"detail", state.GetDebugMessage()}};
}

} // namespace app
} // namespace timechunk
