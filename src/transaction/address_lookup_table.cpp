#include "transaction/address_lookup_table.hpp"
#include "common/errors.hpp"
#include "utils/byte_io.hpp"

AddressLookupTable DecodeLookupTable(const Pubkey& key, const std::vector<uint8_t>& data) {
  using namespace LookupTableLayout;
  if (data.size() < kHeaderSize) throw DecodeError(key, "lookup table shorter than its header");
  if (ByteIO::ReadU32(data, 0) != kLookupTableType) throw DecodeError(key, "not an address lookup table");
  if (ByteIO::ReadU64(data, kDeactivationSlot) != kActive) throw DecodeError(key, "lookup table is deactivated");
  size_t body = data.size() - kHeaderSize;
  if (body % 32 != 0) throw DecodeError(key, "address list is not a multiple of 32 bytes");
  AddressLookupTable table;
  table.key = key;
  for (size_t off = kHeaderSize; off < data.size(); off += 32) table.addresses.push_back(ByteIO::ReadPubkey(data, off));
  return table;
}
