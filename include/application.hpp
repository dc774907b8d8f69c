// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_APPLICATION_HPP
#define TIMECHUNK_APPLICATION_HPP

#include "chunk/network_params.hpp"
#include "index/time_index.hpp"
#include "store/memory_store.hpp"
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace timechunk {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;
  chunk::NetworkType network_type{chunk::NetworkType::MAIN};

  // Network definition file (overrides network_type when set)
  std::string params_file;

  // Hex AgentId; empty means the datadir's persistent identity
  std::string agent_hex;

  // Named index every command operates on
  std::string index_name{DEFAULT_INDEX_NAME};

  static constexpr const char *DEFAULT_INDEX_NAME = "default";
};

// Application - wires params, store and index for one CLI invocation
// Loads the store from <datadir>[/<network>]/store.json on initialize() and
// writes it back after a command that changed it.
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  bool initialize();

  // Execute one command. Result is a JSON document; failures carry an
  // "error" member. Throws std::invalid_argument on malformed arguments.
  nlohmann::json run_command(const std::string &command,
                             const std::vector<std::string> &args);

  // Persist the store if it changed
  bool shutdown();

  const std::filesystem::path &network_dir() const { return network_dir_; }

private:
  bool init_datadir();
  bool init_params();
  bool init_store();
  bool init_agent();

  nlohmann::json cmd_add_link(const std::vector<std::string> &args);
  nlohmann::json cmd_index(const std::vector<std::string> &args);
  nlohmann::json cmd_current();
  nlohmann::json cmd_latest();
  nlohmann::json cmd_span(const std::vector<std::string> &args);
  nlohmann::json cmd_links(const std::vector<std::string> &args);

  nlohmann::json chunk_to_json(const chunk::Chunk &chunk) const;
  nlohmann::json record_to_json(const LinkRecord &record) const;
  static nlohmann::json error_to_json(const validation::ValidationState &state);

  AppConfig config_;
  std::filesystem::path network_dir_;
  std::filesystem::path store_file_;

  std::unique_ptr<chunk::NetworkParams> params_;
  std::unique_ptr<store::MemoryStore> store_;
  std::unique_ptr<index::TimeIndex> index_;
  AgentId agent_;

  bool dirty_{false};
};

} // namespace app
} // namespace timechunk

#endif // TIMECHUNK_APPLICATION_HPP
