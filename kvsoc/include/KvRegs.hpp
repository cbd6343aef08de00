// **********************************************************************
// kvsoc/include/KvRegs.hpp
// **********************************************************************
// S Magierowski Jan 21 2026
/*
Register map of the bus-attached key/value cache (offsets from its base).

  0x00 VALUE_LO   RW  value[31:0]
  0x04 VALUE_HI   RW  value[63:32]
  0x08 KEY        RW  key
  0x0C OPERATION  RW  opcode in [1:0]; 0=NOOP 1=GET 2=UPSERT 3=DELETE
  0x10 STATUS     RO  [0] done [1] hit [2] error [4:3] controller state
  0x14 RESULT_LO  RO  result[31:0]
  0x18 RESULT_HI  RO  result[63:32]
*/
#pragma once

#include <cstdint>

namespace kvregs {

constexpr uint32_t VALUE_LO  = 0x00;
constexpr uint32_t VALUE_HI  = 0x04;
constexpr uint32_t KEY       = 0x08;
constexpr uint32_t OPERATION = 0x0C;
constexpr uint32_t STATUS    = 0x10;
constexpr uint32_t RESULT_LO = 0x14;
constexpr uint32_t RESULT_HI = 0x18;

constexpr uint32_t STATUS_DONE        = 1u << 0;
constexpr uint32_t STATUS_HIT         = 1u << 1;
constexpr uint32_t STATUS_ERROR       = 1u << 2;
constexpr uint32_t STATUS_STATE_SHIFT = 3;
constexpr uint32_t STATUS_STATE_MASK  = 0x3u << STATUS_STATE_SHIFT;

struct StatusBits {
  bool     done  = false;
  bool     hit   = false;
  bool     error = false;
  uint32_t state = 0; // 0=IDLE 1=GET 2=PUT 3=DEL
};

inline uint32_t encode_status(bool done, bool hit, bool error, uint32_t state) {
  return (done  ? STATUS_DONE  : 0u) |
         (hit   ? STATUS_HIT   : 0u) |
         (error ? STATUS_ERROR : 0u) |
         ((state << STATUS_STATE_SHIFT) & STATUS_STATE_MASK);
}

inline StatusBits decode_status(uint32_t word) {
  StatusBits s;
  s.done  = (word & STATUS_DONE)  != 0;
  s.hit   = (word & STATUS_HIT)   != 0;
  s.error = (word & STATUS_ERROR) != 0;
  s.state = (word & STATUS_STATE_MASK) >> STATUS_STATE_SHIFT;
  return s;
}

// byte-lane merge of a write into an RW register
inline uint32_t merge_bytes(uint32_t old, uint32_t data, uint32_t be) {
  uint32_t mask = 0;
  for (int i = 0; i < 4; ++i) {
    if (be & (1u << i)) mask |= 0xFFu << (8 * i);
  }
  return (old & ~mask) | (data & mask);
}

bool        is_mapped(uint32_t offset);
bool        is_writable(uint32_t offset);
const char* reg_name(uint32_t offset); // "?" when unmapped

} // namespace kvregs
