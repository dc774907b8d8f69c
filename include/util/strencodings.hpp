// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#ifndef TIMECHUNK_UTIL_STRENCODINGS_HPP
#define TIMECHUNK_UTIL_STRENCODINGS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace timechunk {
namespace util {

// Lowercase hex, two digits per byte, storage order
std::string HexStr(std::span<const uint8_t> bytes);

// Inverse of HexStr (either case). nullopt on odd length or a non-hex digit.
std::optional<std::vector<uint8_t>> TryParseHex(std::string_view hex);

} // namespace util
} // namespace timechunk

#endif // TIMECHUNK_UTIL_STRENCODINGS_HPP
