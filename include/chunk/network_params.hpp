// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_CHUNK_NETWORK_PARAMS_HPP
#define TIMECHUNK_CHUNK_NETWORK_PARAMS_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace timechunk {
namespace chunk {

/**
 * Network type enumeration
 */
enum class NetworkType {
  MAIN,    // Production network
  TESTNET, // Public test network
  REGTEST, // Regression test (local testing)
  CUSTOM   // Loaded from a network definition file or built in code
};

/**
 * Chunking parameters
 *
 * These are fixed for the lifetime of a network instance. Every peer must
 * use the same values or admission and validation decisions diverge; a
 * change of any value means a new network.
 */
struct ChunkParams {
  // Start of chunk 0 (Unix seconds)
  int64_t nEpoch{0};

  // MAX_CHUNK_INTERVAL: length of one chunk window (seconds)
  int64_t nMaxChunkInterval{3600};

  // DIRECT_CHUNK_LINK_LIMIT: direct links per author per chunk
  uint32_t nDirectChunkLinkLimit{5};

  // ENFORCE_SPAM_LIMIT: total links per author per chunk
  uint32_t nEnforceSpamLimit{20};

  // Clock-skew tolerance for chunks that start in the future (seconds)
  int64_t nMaxFutureDrift{60};
};

/**
 * NetworkParams - immutable parameter set of one network instance
 *
 * Passed by const reference into every component; there is no global
 * instance.
 */
class NetworkParams {
public:
  NetworkParams() = default;
  virtual ~NetworkParams() = default;

  const ChunkParams &GetChunkParams() const { return params; }
  NetworkType GetNetworkType() const { return networkType; }
  std::string GetNetworkTypeString() const;
  const std::string &GetName() const { return name; }

  // Factory methods
  static std::unique_ptr<NetworkParams> CreateMainNet();
  static std::unique_ptr<NetworkParams> CreateTestNet();
  static std::unique_ptr<NetworkParams> CreateRegTest();

  // Throws std::invalid_argument if the parameters are inconsistent
  static std::unique_ptr<NetworkParams> CreateCustom(const ChunkParams &params,
                                                     const std::string &name = "custom");

  /**
   * Build params from a network definition document
   *
   * Recognized keys: "name", "epoch", "max_chunk_interval",
   * "direct_chunk_link_limit", "enforce_spam_limit", "max_future_drift".
   * Missing keys take the REGTEST defaults.
   *
   * Throws std::invalid_argument on wrong types or inconsistent values.
   */
  static std::unique_ptr<NetworkParams> FromJson(const nlohmann::json &doc);

  // Throws std::runtime_error if the file cannot be read or parsed
  static std::unique_ptr<NetworkParams> LoadFromFile(const std::string &filepath);

  nlohmann::json ToJson() const;

protected:
  ChunkParams params;
  NetworkType networkType{NetworkType::MAIN};
  std::string name;
};

/**
 * MainNet parameters
 */
class CMainParams : public NetworkParams {
public:
  CMainParams();
};

/**
 * TestNet parameters
 */
class CTestNetParams : public NetworkParams {
public:
  CTestNetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public NetworkParams {
public:
  CRegTestParams();
};

// Throws std::invalid_argument describing the first violated constraint
void CheckChunkParams(const ChunkParams &params);

} // namespace chunk
} // namespace timechunk

#endif // TIMECHUNK_CHUNK_NETWORK_PARAMS_HPP
