// **********************************************************************
// kvsoc/src/KvRegs.cpp
// **********************************************************************
// S Magierowski Jan 21 2026

#include "KvRegs.hpp"

namespace kvregs {

bool is_mapped(uint32_t offset) {
  switch (offset) {
    case VALUE_LO: case VALUE_HI: case KEY: case OPERATION:
    case STATUS: case RESULT_LO: case RESULT_HI:
      return true;
    default:
      return false;
  }
}

bool is_writable(uint32_t offset) {
  return offset == VALUE_LO || offset == VALUE_HI || offset == KEY || offset == OPERATION;
}

const char* reg_name(uint32_t offset) {
  switch (offset) {
    case VALUE_LO:  return "VALUE_LO";
    case VALUE_HI:  return "VALUE_HI";
    case KEY:       return "KEY";
    case OPERATION: return "OPERATION";
    case STATUS:    return "STATUS";
    case RESULT_LO: return "RESULT_LO";
    case RESULT_HI: return "RESULT_HI";
    default:        return "?";
  }
}

} // namespace kvregs
