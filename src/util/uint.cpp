// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "util/uint.hpp"
#include "util/strencodings.hpp"
#include <algorithm>

namespace timechunk {

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  return util::HexStr(m_data);
}

template <unsigned int BITS> bool base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() != static_cast<size_t>(WIDTH) * 2) {
    return false;
  }

  auto parsed = util::TryParseHex(str);
  if (!parsed) {
    return false;
  }
  std::copy(parsed->begin(), parsed->end(), m_data.begin());
  return true;
}

// Explicit instantiation
template class base_blob<256>;

std::optional<uint256> uint256::FromHex(std::string_view str) {
  uint256 out;
  if (!out.SetHex(str)) {
    return std::nullopt;
  }
  return out;
}

} // namespace timechunk
