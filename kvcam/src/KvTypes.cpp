// **********************************************************************
// kvcam/src/KvTypes.cpp
// **********************************************************************
// S Magierowski Jan 12 2026

#include "KvTypes.hpp"

namespace kvcam {

const char* opcode_name(Opcode op) {
  switch (op) {
    case Opcode::Noop:   return "NOOP";
    case Opcode::Get:    return "GET";
    case Opcode::Upsert: return "UPSERT";
    case Opcode::Delete: return "DELETE";
  }
  return "?";
}

const char* busy_policy_name(BusyWritePolicy p) {
  return p == BusyWritePolicy::Reject ? "reject" : "buffer";
}

bool parse_busy_policy(const std::string& text, BusyWritePolicy* out) {
  if (text == "buffer") { *out = BusyWritePolicy::Buffer; return true; }
  if (text == "reject") { *out = BusyWritePolicy::Reject; return true; }
  return false;
}

} // namespace kvcam
