#include "transaction/message.hpp"
#include "utils/byte_io.hpp"
#include <stdexcept>
#include <unordered_map>

std::string ToString(TransactionFormat format) {
  return format == TransactionFormat::V0 ? "v0" : "legacy";
}

namespace ShortVec {
  void Append(std::vector<uint8_t>& out, size_t value) {
    if (value > 0xffff) throw std::invalid_argument("compact-u16 overflow");
    do {
      uint8_t byte = value & 0x7f;
      value >>= 7;
      if (value) byte |= 0x80;
      out.push_back(byte);
    } while (value);
  }

  size_t EncodedLength(size_t value) {
    std::vector<uint8_t> tmp;
    Append(tmp, value);
    return tmp.size();
  }
}

namespace {
  struct KeyMeta {
    Pubkey key;
    bool signer = false;
    bool writable = false;
    bool invoked = false;
  };

  // Keys in first-appearance order with merged flags; payer first
  std::vector<KeyMeta> CollectKeys(const Pubkey& payer, const std::vector<Instruction>& instructions) {
    std::vector<KeyMeta> keys;
    std::unordered_map<Pubkey, size_t, PubkeyHash> index;
    auto touch = [&](const Pubkey& k) -> KeyMeta& {
      auto it = index.find(k);
      if (it != index.end()) return keys[it->second];
      index[k] = keys.size();
      keys.push_back(KeyMeta{k});
      return keys.back();
    };
    KeyMeta& p = touch(payer);
    p.signer = true;
    p.writable = true;
    for (const auto& ix : instructions) {
      for (const auto& meta : ix.accounts) {
        KeyMeta& m = touch(meta.pubkey);
        m.signer |= meta.is_signer;
        m.writable |= meta.is_writable;
      }
      touch(ix.program_id).invoked = true;
    }
    return keys;
  }

  int Group(const KeyMeta& m) {
    if (m.signer) return m.writable ? 0 : 1;
    return m.writable ? 2 : 3;
  }

  void OrderStatic(const std::vector<KeyMeta>& keys, Message& msg) {
    for (int g = 0; g < 4; ++g) {
      for (const auto& m : keys) {
        if (Group(m) != g) continue;
        msg.account_keys.push_back(m.key);
        if (m.signer) ++msg.header.num_required_signatures;
        if (g == 1) ++msg.header.num_readonly_signed;
        if (g == 3) ++msg.header.num_readonly_unsigned;
      }
    }
  }

  void CompileInstructions(const std::vector<Instruction>& instructions,
                           const std::unordered_map<Pubkey, size_t, PubkeyHash>& index, Message& msg) {
    auto at = [&](const Pubkey& k) -> uint8_t {
      auto it = index.find(k);
      if (it == index.end()) throw std::invalid_argument("account " + k.ToBase58() + " missing from message");
      return static_cast<uint8_t>(it->second);
    };
    for (const auto& ix : instructions) {
      CompiledInstruction c;
      c.program_index = at(ix.program_id);
      for (const auto& meta : ix.accounts) c.account_indexes.push_back(at(meta.pubkey));
      c.data = ix.data;
      msg.instructions.push_back(std::move(c));
    }
  }
}

namespace MessageCompiler {
  Message CompileLegacy(const Pubkey& payer, const std::vector<Instruction>& instructions, const Pubkey& blockhash) {
    Message msg;
    msg.format = TransactionFormat::Legacy;
    msg.recent_blockhash = blockhash;
    auto keys = CollectKeys(payer, instructions);
    if (keys.size() > 256) throw std::invalid_argument(std::to_string(keys.size()) + " accounts exceed the legacy limit");
    OrderStatic(keys, msg);
    std::unordered_map<Pubkey, size_t, PubkeyHash> index;
    for (size_t i = 0; i < msg.account_keys.size(); ++i) index[msg.account_keys[i]] = i;
    CompileInstructions(instructions, index, msg);
    return msg;
  }

  Message CompileV0(const Pubkey& payer, const std::vector<Instruction>& instructions, const Pubkey& blockhash,
                    const std::vector<AddressLookupTable>& tables) {
    Message msg;
    msg.format = TransactionFormat::V0;
    msg.recent_blockhash = blockhash;
    auto keys = CollectKeys(payer, instructions);

    // Table position of every address that may be loaded
    std::vector<std::unordered_map<Pubkey, uint8_t, PubkeyHash>> table_index(tables.size());
    for (size_t t = 0; t < tables.size(); ++t) {
      for (size_t i = 0; i < tables[t].addresses.size() && i < 256; ++i) {
        table_index[t].emplace(tables[t].addresses[i], static_cast<uint8_t>(i));
      }
    }

    std::vector<KeyMeta> static_keys;
    std::vector<MessageTableLookup> lookups(tables.size());
    std::vector<std::vector<Pubkey>> loaded_writable(tables.size()), loaded_readonly(tables.size());
    for (const auto& m : keys) {
      bool loaded = false;
      if (!m.signer && !m.invoked) {
        for (size_t t = 0; t < tables.size() && !loaded; ++t) {
          auto it = table_index[t].find(m.key);
          if (it == table_index[t].end()) continue;
          if (m.writable) {
            lookups[t].writable_indexes.push_back(it->second);
            loaded_writable[t].push_back(m.key);
          } else {
            lookups[t].readonly_indexes.push_back(it->second);
            loaded_readonly[t].push_back(m.key);
          }
          loaded = true;
        }
      }
      if (!loaded) static_keys.push_back(m);
    }
    if (static_keys.size() > 256) throw std::invalid_argument("too many static accounts for v0");
    OrderStatic(static_keys, msg);

    std::unordered_map<Pubkey, size_t, PubkeyHash> index;
    for (size_t i = 0; i < msg.account_keys.size(); ++i) index[msg.account_keys[i]] = i;
    size_t next = msg.account_keys.size();
    for (size_t t = 0; t < tables.size(); ++t) {
      for (const auto& k : loaded_writable[t]) index[k] = next++;
    }
    for (size_t t = 0; t < tables.size(); ++t) {
      for (const auto& k : loaded_readonly[t]) index[k] = next++;
    }
    if (next > 256) throw std::invalid_argument(std::to_string(next) + " accounts exceed the v0 limit");
    for (size_t t = 0; t < tables.size(); ++t) {
      if (lookups[t].writable_indexes.empty() && lookups[t].readonly_indexes.empty()) continue;
      lookups[t].table = tables[t].key;
      msg.lookups.push_back(std::move(lookups[t]));
    }
    CompileInstructions(instructions, index, msg);
    return msg;
  }
}

std::vector<uint8_t> Message::Serialize() const {
  std::vector<uint8_t> out;
  if (format == TransactionFormat::V0) out.push_back(0x80);
  out.push_back(header.num_required_signatures);
  out.push_back(header.num_readonly_signed);
  out.push_back(header.num_readonly_unsigned);
  ShortVec::Append(out, account_keys.size());
  for (const auto& k : account_keys) ByteIO::AppendPubkey(out, k);
  ByteIO::AppendPubkey(out, recent_blockhash);
  ShortVec::Append(out, instructions.size());
  for (const auto& ix : instructions) {
    out.push_back(ix.program_index);
    ShortVec::Append(out, ix.account_indexes.size());
    ByteIO::AppendBytes(out, ix.account_indexes);
    ShortVec::Append(out, ix.data.size());
    ByteIO::AppendBytes(out, ix.data);
  }
  if (format == TransactionFormat::V0) {
    ShortVec::Append(out, lookups.size());
    for (const auto& l : lookups) {
      ByteIO::AppendPubkey(out, l.table);
      ShortVec::Append(out, l.writable_indexes.size());
      ByteIO::AppendBytes(out, l.writable_indexes);
      ShortVec::Append(out, l.readonly_indexes.size());
      ByteIO::AppendBytes(out, l.readonly_indexes);
    }
  }
  return out;
}

size_t Message::TransactionSize() const {
  size_t sigs = header.num_required_signatures;
  return ShortVec::EncodedLength(sigs) + 64 * sigs + Serialize().size();
}

std::vector<uint8_t> SignedTransaction::Serialize() const {
  std::vector<uint8_t> out;
  ShortVec::Append(out, signatures.size());
  for (const auto& s : signatures) out.insert(out.end(), s.begin(), s.end());
  ByteIO::AppendBytes(out, message.Serialize());
  return out;
}

std::string SignedTransaction::Id() const {
  if (signatures.empty()) return "";
  return SignatureToBase58(signatures.front());
}

SignedTransaction SignMessage(const Message& message, const std::vector<const TransactionSigner*>& signers) {
  SignedTransaction tx;
  tx.message = message;
  auto bytes = message.Serialize();
  for (size_t i = 0; i < message.header.num_required_signatures; ++i) {
    const Pubkey& required = message.account_keys.at(i);
    const TransactionSigner* found = nullptr;
    for (const auto* s : signers) {
      if (s && s->PublicKey() == required) found = s;
    }
    if (!found) throw std::invalid_argument("no signer for " + required.ToBase58());
    tx.signatures.push_back(found->Sign(bytes));
  }
  return tx;
}
