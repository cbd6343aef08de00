// **********************************************************************
// kvsoc/src/Console.cpp
// **********************************************************************
// S Magierowski Jan 24 2026

#include "Console.hpp"

#include <cascade/SimGlobals.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kvsoc {
namespace {

static constexpr const char* COLOR_RESET = "\033[0m";
static constexpr const char* COLOR_OK    = "\033[32m";
static constexpr const char* COLOR_ERR   = "\033[31m";
static constexpr const char* COLOR_HINT  = "\033[36m";

static std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

static bool parse_u64(const std::string& text, uint64_t* value) {
  try {
    size_t idx = 0;
    const unsigned long long parsed = std::stoull(text, &idx, 0);
    if (idx != text.size()) {
      return false;
    }
    *value = static_cast<uint64_t>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

static bool parse_key(const std::string& text, KeyWord* key) {
  uint64_t v = 0;
  if (!parse_u64(text, &v) || v > std::numeric_limits<KeyWord>::max()) {
    return false;
  }
  *key = static_cast<KeyWord>(v);
  return true;
}

static void print_cycle_trace(const ConsoleState& state) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  const KvCache& c = *state.soc.cache_;
  const kvregs::StatusBits st = kvregs::decode_status(c.status_word());
  std::cout << "cycle " << state.cycle
            << " state=" << ctrl_state_name(c.ctrl().state())
            << " STATUS=0x" << std::hex << std::setw(2) << c.status_word()
            << std::dec << " done=" << st.done << " hit=" << st.hit << " error=" << st.error
            << " used=" << c.slots().used_count()
            << std::endl;

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

static void print_registers(const ConsoleState& state) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  const KvCache& c = *state.soc.cache_;
  for (uint32_t off = kvregs::VALUE_LO; off <= kvregs::RESULT_HI; off += 4u) {
    std::cout << "  [0x" << std::hex << std::setw(2) << off << "] "
              << std::left << std::setfill(' ') << std::setw(10) << kvregs::reg_name(off)
              << std::right << std::setfill('0')
              << " = 0x" << std::setw(8) << c.peek(off)
              << std::dec << std::endl;
  }

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

static void print_stats(const ConsoleState& state) {
  const KvCache& c = *state.soc.cache_;
  const Controller::Stats& s = c.ctrl().stats();
  const KvCache::BusStats& b = c.bus_stats();
  std::cout << "engine: gets=" << s.gets << " (hits " << s.get_hits << ")"
            << " upserts=" << s.upserts << " (inserts " << s.inserts << ", updates " << s.updates << ")"
            << " deletes=" << s.deletes << " errors=" << s.errors << " aborts=" << s.aborts
            << " busy_cycles=" << s.busy_cycles << std::endl;
  std::cout << "bus:    reads=" << b.reads << " writes=" << b.writes
            << " rejected=" << b.rejected << " unmapped=" << b.unmapped << std::endl;
  std::cout << "slots:  " << c.slots().used_count() << "/" << c.slots().num_slots()
            << " used, busy_writes=" << kvcam::busy_policy_name(c.config().busy_writes)
            << ", cycle " << state.cycle << std::endl;
}

} // namespace

ConsoleState::ConsoleState(KvSoc& s)
  : soc(s) {
  reset();
}

void ConsoleState::reset() {
  cycle = 0;
  trace_enabled = false;
  user_quit = false;
}

void step_cycles(ConsoleState& state, int n) {
  for (int i = 0; i < n; ++i) {
    Sim::run();
    log("\n");
    state.cycle++;
    if (state.trace_enabled) {
      print_cycle_trace(state);
    }
  }
}

void reset_soc(ConsoleState& state) {
  state.soc.master_->clear_script();
  state.soc.set_rst(true);
  step_cycles(state, 2);
  state.soc.set_rst(false);
}

bool issue_command(ConsoleState& state, Opcode op, KeyWord key, ValueWord value, BusOutcome* out) {
  ObiMaster& m = *state.soc.master_;
  const int budget = state.soc.config().poll_budget;
  m.clear_script();
  m.enqueue_command(op, key, value, budget);
  // 4 writes + polls + 2 reads, plus slack for the final response
  const int limit = 4 + budget + 2 + 2;
  for (int i = 0; i < limit && !m.idle(); ++i) {
    step_cycles(state, 1);
  }
  *out = last_command_outcome(m);
  return m.idle() && out->ok;
}

void print_outcome(Opcode op, KeyWord key, const BusOutcome& out) {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  if (!out.ok) {
    std::cout << COLOR_ERR << kvcam::opcode_name(op) << " key=0x" << std::hex << std::setw(8) << key
              << " did not complete" << COLOR_RESET << std::endl;
  } else {
    const bool bad = out.status.error || out.bus_err;
    std::cout << (bad ? COLOR_ERR : COLOR_OK)
              << kvcam::opcode_name(op) << " key=0x" << std::hex << std::setw(8) << key
              << std::dec << " done=" << out.status.done << " hit=" << out.status.hit
              << " error=" << out.status.error;
    if (op != Opcode::Delete) {
      std::cout << " value=0x" << std::hex << std::setw(16) << out.result;
    }
    std::cout << std::dec << " (" << out.cycles << " cycles, " << out.polls << " polls)"
              << COLOR_RESET << std::endl;
  }

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}

void run_console(ConsoleState& state) {
  std::cout << "Entering key/value console. Type 'help' for commands." << std::endl;
  std::string line;

  while (true) {
    std::cout << "kvsoc> " << std::flush;
    if (!std::getline(std::cin, line)) {
      state.user_quit = true;
      break;
    }

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    if (command.empty()) {
      continue;
    }

    const std::string cmd = to_lower(command);
    if (cmd == "put" || cmd == "get" || cmd == "del") {
      std::string key_token, value_token;
      if (!(iss >> key_token)) {
        std::cout << "Usage: " << cmd << " <key>" << (cmd == "put" ? " <value>" : "") << std::endl;
        continue;
      }
      KeyWord key = 0;
      if (!parse_key(key_token, &key)) {
        std::cout << COLOR_ERR << "Invalid key (32-bit)" << COLOR_RESET << std::endl;
        continue;
      }
      uint64_t value = 0;
      if (cmd == "put") {
        if (!(iss >> value_token) || !parse_u64(value_token, &value)) {
          std::cout << COLOR_ERR << "Invalid value (64-bit)" << COLOR_RESET << std::endl;
          continue;
        }
      }
      const Opcode op = cmd == "put" ? Opcode::Upsert : (cmd == "get" ? Opcode::Get : Opcode::Delete);
      BusOutcome out;
      issue_command(state, op, key, value, &out);
      print_outcome(op, key, out);
    } else if (cmd == "step") {
      uint64_t count = 1;
      std::string count_token;
      if (iss >> count_token) {
        if (!parse_u64(count_token, &count) || count == 0 || count > 1000000u) {
          std::cout << COLOR_ERR << "Invalid step count" << COLOR_RESET << std::endl;
          continue;
        }
      }
      step_cycles(state, static_cast<int>(count));
      print_cycle_trace(state);
    } else if (cmd == "dump") {
      state.soc.cache_->slots().dump();
    } else if (cmd == "regs") {
      print_registers(state);
    } else if (cmd == "stats") {
      print_stats(state);
    } else if (cmd == "abort") {
      state.soc.cache_->request_abort();
      step_cycles(state, 1);
      print_cycle_trace(state);
    } else if (cmd == "reset") {
      reset_soc(state);
      std::cout << "Reset: registers, slots and controller cleared" << std::endl;
      print_cycle_trace(state);
    } else if (cmd == "trace") {
      std::string mode;
      if (iss >> mode) {
        mode = to_lower(mode);
        if (mode == "on") {
          state.trace_enabled = true;
        } else if (mode == "off") {
          state.trace_enabled = false;
        } else {
          std::cout << "Usage: trace [on|off]" << std::endl;
          continue;
        }
      } else {
        state.trace_enabled = !state.trace_enabled;
      }
      std::cout << "Trace " << (state.trace_enabled ? "enabled" : "disabled") << std::endl;
    } else if (cmd == "quit" || cmd == "q") {
      state.user_quit = true;
      break;
    } else if (cmd == "help") {
      std::cout << COLOR_HINT << "Commands:" << COLOR_RESET << "\n"
                << "  put <key> <value>  - UPSERT through the bus\n"
                << "  get <key>          - GET through the bus\n"
                << "  del <key>          - DELETE through the bus\n"
                << "  dump               - list occupied slots\n"
                << "  regs               - show the register file\n"
                << "  stats              - engine and bus counters\n"
                << "  step [N]           - advance N cycles (default 1)\n"
                << "  abort              - cancel the in-flight operation\n"
                << "  reset              - hold the reset input for two cycles, then release\n"
                << "  trace [on|off]     - toggle per-cycle status lines\n"
                << "  quit               - exit console\n";
    } else {
      std::cout << "Unknown command: " << command << std::endl;
    }
  }
}

} // namespace kvsoc
