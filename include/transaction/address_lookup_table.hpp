#pragma once
#include "common/pubkey.hpp"
#include <cstdint>
#include <vector>

struct AddressLookupTable {
  Pubkey key;
  std::vector<Pubkey> addresses;
};

namespace LookupTableLayout {
  constexpr size_t kHeaderSize = 56;
  constexpr uint32_t kLookupTableType = 1;
  constexpr size_t kDeactivationSlot = 4;
  constexpr uint64_t kActive = UINT64_MAX;
}

// Throws DecodeError for a wrong type tag, a deactivated table or a ragged address list
AddressLookupTable DecodeLookupTable(const Pubkey& key, const std::vector<uint8_t>& data);
