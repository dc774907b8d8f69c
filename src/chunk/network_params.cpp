// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "chunk/network_params.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <stdexcept>

namespace timechunk {
namespace chunk {

namespace {

class CCustomParams : public NetworkParams {
public:
  CCustomParams(const ChunkParams &custom, const std::string &custom_name) {
    networkType = NetworkType::CUSTOM;
    params = custom;
    name = custom_name;
  }
};

} // namespace

void CheckChunkParams(const ChunkParams &p) {
  if (p.nEpoch < 0) {
    throw std::invalid_argument("epoch must not be negative");
  }
  if (p.nMaxChunkInterval <= 0) {
    throw std::invalid_argument("max_chunk_interval must be positive");
  }
  if (p.nDirectChunkLinkLimit == 0) {
    throw std::invalid_argument("direct_chunk_link_limit must be positive");
  }
  if (p.nEnforceSpamLimit == 0) {
    throw std::invalid_argument("enforce_spam_limit must be positive");
  }
  if (p.nDirectChunkLinkLimit > p.nEnforceSpamLimit) {
    throw std::invalid_argument(
        "direct_chunk_link_limit must not exceed enforce_spam_limit");
  }
  if (p.nMaxFutureDrift < 0) {
    throw std::invalid_argument("max_future_drift must not be negative");
  }
}

std::string NetworkParams::GetNetworkTypeString() const {
  switch (networkType) {
  case NetworkType::MAIN:
    return "main";
  case NetworkType::TESTNET:
    return "test";
  case NetworkType::REGTEST:
    return "regtest";
  case NetworkType::CUSTOM:
    return "custom";
  }
  return "unknown";
}

std::unique_ptr<NetworkParams> NetworkParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<NetworkParams> NetworkParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<NetworkParams>
NetworkParams::CreateCustom(const ChunkParams &params, const std::string &name) {
  CheckChunkParams(params);
  return std::make_unique<CCustomParams>(params, name);
}

std::unique_ptr<NetworkParams> NetworkParams::FromJson(const nlohmann::json &doc) {
  if (!doc.is_object()) {
    throw std::invalid_argument("network definition must be a JSON object");
  }

  ChunkParams p = CRegTestParams().GetChunkParams();
  std::string name = "custom";

  try {
    name = doc.value("name", name);
    p.nEpoch = doc.value("epoch", p.nEpoch);
    p.nMaxChunkInterval = doc.value("max_chunk_interval", p.nMaxChunkInterval);
    p.nDirectChunkLinkLimit =
        doc.value("direct_chunk_link_limit", p.nDirectChunkLinkLimit);
    p.nEnforceSpamLimit = doc.value("enforce_spam_limit", p.nEnforceSpamLimit);
    p.nMaxFutureDrift = doc.value("max_future_drift", p.nMaxFutureDrift);
  } catch (const nlohmann::json::exception &e) {
    throw std::invalid_argument(std::string("bad network definition: ") +
                                e.what());
  }

  return CreateCustom(p, name);
}

std::unique_ptr<NetworkParams>
NetworkParams::LoadFromFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open network definition: " + filepath);
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("cannot parse network definition " + filepath +
                             ": " + e.what());
  }

  auto params = FromJson(doc);
  LOG_CHUNK_INFO("Loaded network '{}' from {} (interval={}s, direct={}, spam={})",
                 params->GetName(), filepath,
                 params->GetChunkParams().nMaxChunkInterval,
                 params->GetChunkParams().nDirectChunkLinkLimit,
                 params->GetChunkParams().nEnforceSpamLimit);
  return params;
}

nlohmann::json NetworkParams::ToJson() const {
  nlohmann::json doc;
  doc["name"] = name;
  doc["type"] = GetNetworkTypeString();
  doc["epoch"] = params.nEpoch;
  doc["max_chunk_interval"] = params.nMaxChunkInterval;
  doc["direct_chunk_link_limit"] = params.nDirectChunkLinkLimit;
  doc["enforce_spam_limit"] = params.nEnforceSpamLimit;
  doc["max_future_drift"] = params.nMaxFutureDrift;
  return doc;
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  networkType = NetworkType::MAIN;
  name = "main";

  params.nEpoch = 1704067200;          // 2024-01-01 00:00:00 UTC
  params.nMaxChunkInterval = 60 * 60;  // 1 hour
  params.nDirectChunkLinkLimit = 5;
  params.nEnforceSpamLimit = 20;
  params.nMaxFutureDrift = 60;
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  networkType = NetworkType::TESTNET;
  name = "test";

  params.nEpoch = 1704067200;
  params.nMaxChunkInterval = 5 * 60; // 5 minutes
  params.nDirectChunkLinkLimit = 5;
  params.nEnforceSpamLimit = 20;
  params.nMaxFutureDrift = 60;
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  networkType = NetworkType::REGTEST;
  name = "regtest";

  // Short windows so tests cross chunk boundaries quickly
  params.nEpoch = 1296688602;
  params.nMaxChunkInterval = 100;
  params.nDirectChunkLinkLimit = 2;
  params.nEnforceSpamLimit = 20;
  params.nMaxFutureDrift = 60;
}

} // namespace chunk
} // namespace timechunk
