// **********************************************************************
// kvsoc/include/Console.hpp
// **********************************************************************
// S Magierowski Jan 24 2026
/*
Command console REPL for the key/value SoC. Every command goes through the
bus master, so what you see is what a CPU driving the registers would see.
*/
#pragma once

#include "KvSoc.hpp"

namespace kvsoc {

struct ConsoleState {
  KvSoc &soc;
  int cycle;
  bool trace_enabled;
  bool user_quit;

  explicit ConsoleState(KvSoc &s);
  void reset();
};

// run one bus command to completion (or until the poll budget expires)
bool issue_command(ConsoleState &state, Opcode op, KeyWord key, ValueWord value, BusOutcome *out);
void step_cycles(ConsoleState &state, int n);
void reset_soc(ConsoleState &state);    // drives the reset input for two cycles
void print_outcome(Opcode op, KeyWord key, const BusOutcome &out);
void run_console(ConsoleState &state);

} // namespace kvsoc
