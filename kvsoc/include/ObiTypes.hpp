// **********************************************************************
// kvsoc/include/ObiTypes.hpp
// **********************************************************************
// S Magierowski Jan 21 2026

#pragma once
#include <cascade/Cascade.hpp>

// Register-bus packet types (FIFO-friendly), one 32b data beat per request.
// A push on the request FIFO is req=1; the slave's response push is
// rvalid=1 and carries gnt for the cycle it accepted the request.
struct ObiReq {
  u32  addr  = 0;     // byte address, word aligned for mapped registers
  u32  wdata = 0;     // write data
  u8   be    = 0xF;   // byte enables, bit i <=> wdata[8i+7:8i]
  bit  we    = false; // we=1 write, we=0 read
  u16  aid   = 0;     // request id (master-provided)
};

struct ObiResp {
  u32  rdata = 0;     // read data, 0 for writes and unmapped reads
  bit  err   = false; // 1 only for rejected writes (busy_writes=reject)
  u16  rid   = 0;     // echoes aid
  bit  gnt   = false;
};
