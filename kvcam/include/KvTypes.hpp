// **********************************************************************
// kvcam/include/KvTypes.hpp
// **********************************************************************
// S Magierowski Jan 12 2026
/*
Shared words and helpers for the key/value CAM engine.
Slots are named on the wires by a one-hot mask (bit i <=> slot i), never
by a dense index; helpers below convert at component boundaries.
*/
#pragma once

#include <bitset>
#include <cstdint>
#include <string>

using KeyWord   = uint32_t; // lookup/insert/delete key
using ValueWord = uint64_t; // payload (two 32b bus words)
using SlotMask  = uint64_t; // one-hot slot select or occupancy vector

enum class Opcode : uint32_t { // mnemonic mapping of the OPERATION register
  Noop   = 0u,
  Get    = 1u,                 // READ
  Upsert = 2u,                 // WRITE / PUT
  Delete = 3u,
};

// what the bus does with VALUE/KEY/OPERATION writes while an op is in flight
enum class BusyWritePolicy {
  Buffer, // accept; they land in the registers for the *next* operation
  Reject, // drop the write and answer err=1
};

struct KvConfig {
  int             num_slots   = 16;                     // 1..kMaxSlots
  BusyWritePolicy busy_writes = BusyWritePolicy::Buffer;
  int             poll_budget = 20;                     // cycles a caller waits for IDLE
  static constexpr int kMaxSlots = 64;                  // one-hot must fit a SlotMask
};

// packed {done, error} pair each sub-machine reports to the controller
struct CmdStatus {
  bool done  = false;
  bool error = false;
};

// latched outcome of the last operation, surfaced through STATUS/RESULT
struct OpResult {
  bool      done  = false;
  bool      hit   = false;
  bool      error = false;
  ValueWord value = 0;
};

// snapshot of the operand registers taken when the controller leaves IDLE
struct OpRequest {
  Opcode    op    = Opcode::Noop;
  KeyWord   key   = 0;
  ValueWord value = 0;
};

namespace kvcam {

inline bool is_onehot(SlotMask m) { return m != 0 && (m & (m - 1)) == 0; }

inline SlotMask index_to_onehot(int idx) { return SlotMask(1) << idx; }

// caller guarantees is_onehot(m)
inline int onehot_to_index(SlotMask m) {
  int idx = 0;
  while ((m & 1u) == 0) { m >>= 1; ++idx; }
  return idx;
}

inline int popcount(SlotMask m) { return static_cast<int>(std::bitset<64>(m).count()); }

// all slots [0, n) set
inline SlotMask full_mask(int n) { return n >= 64 ? ~SlotMask(0) : (SlotMask(1) << n) - 1; }

inline Opcode decode_opcode(uint32_t raw) { return static_cast<Opcode>(raw & 0x3u); }

const char* opcode_name(Opcode op);
const char* busy_policy_name(BusyWritePolicy p);
bool parse_busy_policy(const std::string& text, BusyWritePolicy* out);

} // namespace kvcam
