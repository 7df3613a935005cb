#pragma once
#include "common/pubkey.hpp"
#include "transaction/address_lookup_table.hpp"
#include "transaction/instruction.hpp"
#include "wallet/signer.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class TransactionFormat { Legacy, V0 };

std::string ToString(TransactionFormat format);

struct MessageHeader {
  uint8_t num_required_signatures = 0;
  uint8_t num_readonly_signed = 0;
  uint8_t num_readonly_unsigned = 0;
};

struct CompiledInstruction {
  uint8_t program_index = 0;
  std::vector<uint8_t> account_indexes;
  std::vector<uint8_t> data;
};

struct MessageTableLookup {
  Pubkey table;
  std::vector<uint8_t> writable_indexes;
  std::vector<uint8_t> readonly_indexes;
};

struct Message {
  TransactionFormat format = TransactionFormat::Legacy;
  MessageHeader header;
  // Static keys: writable signers, readonly signers, writable, readonly
  std::vector<Pubkey> account_keys;
  Pubkey recent_blockhash;
  std::vector<CompiledInstruction> instructions;
  std::vector<MessageTableLookup> lookups;  // v0 only

  std::vector<uint8_t> Serialize() const;
  // Wire size of the signed transaction carrying this message
  size_t TransactionSize() const;
};

namespace ShortVec {
  // compact-u16 length prefix
  void Append(std::vector<uint8_t>& out, size_t value);
  size_t EncodedLength(size_t value);
}

namespace MessageCompiler {
  // Throws std::invalid_argument when the key set does not fit the format
  Message CompileLegacy(const Pubkey& payer, const std::vector<Instruction>& instructions, const Pubkey& blockhash);
  Message CompileV0(const Pubkey& payer, const std::vector<Instruction>& instructions, const Pubkey& blockhash,
                    const std::vector<AddressLookupTable>& tables);
}

struct SignedTransaction {
  Message message;
  std::vector<Signature> signatures;

  std::vector<uint8_t> Serialize() const;
  // First signature, which is the transaction id
  std::string Id() const;
};

// Signs with every signer the header requires; throws std::invalid_argument on a missing signer
SignedTransaction SignMessage(const Message& message, const std::vector<const TransactionSigner*>& signers);
