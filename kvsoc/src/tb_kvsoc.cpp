// **********************************************************************
// kvsoc/src/tb_kvsoc.cpp
// **********************************************************************
// S Magierowski Jan 24 2026
/*
System test harness: ObiMaster drives the key/value cache through its
registers. One switch selects what runs:
  -suite=<bus_* | kv_*>  scripted bus suites, asserting on every response
  -suite=console         interactive command console (put/get/del/...)
  -suite=none            nothing scripted; -steps=N batch or Enter to step

// Step 1: Parse CLI (-trace, -suite, -slots, -busy_writes, -poll_budget, ...).
// Step 2: Build configuration and SoC.
// Step 3: Optionally list component names.
// Step 4: Hook clock and initialize simulator.
// Step 5: Banner.
// Step 6: Run the bus suite.
// Step 7: Console, batch (-steps=N) or interactive loop (Enter to step).

to configure, build, and run:
% cmake -S . -B build
% cmake --build build --target tb_kvsoc -j
build % ./tb_kvsoc -suite=kv_e2e
build % ./tb_kvsoc -suite=console -slots=8 -trace=soc.cache
*/
#include <descore/Parameter.hpp>
#include "KvSoc.hpp"
#include "Console.hpp"
#include "Invariants.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <cstdio>
#include <iostream>
#include <string>

using namespace std;

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite,       "kv_e2e", "Suite: bus_regs|bus_byte_enable|bus_unmapped|bus_readonly|kv_e2e|kv_sequential|kv_update|kv_full|kv_delete_miss|kv_busy_buffer|kv_busy_reject|kv_abort|kv_abort_pending|kv_reset|kv_console_reset|kv_timing|console|none");
IntParameter(steps,           0,       "Batch steps; 0=interactive (with -suite=none)");
IntParameter(slots,          16,       "Slots in the cache (1..64)");
StringParameter(busy_writes, "buffer", "VALUE/KEY/OPERATION writes while busy: buffer|reject");
IntParameter(poll_budget,    20,       "STATUS polls allowed per command");
BoolParameter(showcontexts,  false,    "List component instance names (contexts) and exit");

int main(int argc, char *argv[])
{
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Resolve configuration and suite; then build SoC
  // **************
  KvConfig cfg;
  cfg.num_slots   = (int)slots;
  cfg.poll_budget = (int)poll_budget;
  bool policy_ok  = kvcam::parse_busy_policy(std::string(busy_writes), &cfg.busy_writes);
  assert_always(policy_ok, "unknown -busy_writes (buffer|reject)");
  assert_always(cfg.poll_budget > 0, "-poll_budget must be positive");

  std::string S = std::string(suite);
  bool is_bus = S.rfind("bus_", 0) == 0;
  bool is_kv  = S.rfind("kv_",  0) == 0;
  assert_always(is_bus || is_kv || S == "console" || S == "none", "unknown -suite");
  KvSoc soc(cfg);

  // **************
  // Step 3: Optional: list component instance names and exit
  // **************
  if (showcontexts) { Sim::dumpComponentNames(); return 0; }

  // **************
  // Step 4: Hook clock and initialize simulator
  // **************
  Clock clk;
  soc.clk << clk;
  clk.generateClock();
  Sim::init();

  // **************
  // Step 5: Banner (what will run)
  // **************
  cout << "Suite: " << S << endl;
  cout << "Slots: " << cfg.num_slots << endl;
  cout << "Busy writes: " << kvcam::busy_policy_name(cfg.busy_writes) << endl;
  cout << "Poll budget (cycles): " << cfg.poll_budget << endl;

  // **************
  // Step 6: Bus suites (ObiMaster drives KvCache)
  // **************
  ObiMaster* m = soc.master_;
  KvCache*   c = soc.cache_;

  // advance until the script drains; false if it does not within `limit`
  auto drain = [&](int limit) -> bool {
    for (int i = 0; i < limit && !m->idle(); ++i) { Sim::run(); log("\n"); }
    return m->idle();
  };
  auto command = [&](Opcode op, KeyWord key, ValueWord value) -> BusOutcome {
    m->clear_script();
    m->enqueue_command(op, key, value, cfg.poll_budget);
    bool ok = drain(4 + cfg.poll_budget + 4);
    assert_always(ok, "command: script did not drain");
    BusOutcome out = last_command_outcome(*m);
    assert_always(out.ok, "command: STATUS never returned to IDLE");
    return out;
  };
  auto read_reg = [&](uint32_t addr) -> ObiMaster::Ev {
    m->clear_script();
    m->enqueue_read(addr);
    assert_always(drain(4), "read: no response");
    return m->results().back();
  };
  auto write_reg = [&](uint32_t addr, uint32_t data, uint8_t be) -> ObiMaster::Ev {
    m->clear_script();
    m->enqueue_write(addr, data, be);
    assert_always(drain(4), "write: no response");
    return m->results().back();
  };

  auto run_suite = [&](const std::string& s) -> bool {
    m->clear_script(); m->clear_results();
    if (s == "bus_regs") {
      assert_always(read_reg(kvregs::STATUS).rdata == 0, "regs: STATUS not zero after reset");
      write_reg(kvregs::VALUE_LO, 0x8765FFFFu, 0xF);
      write_reg(kvregs::VALUE_HI, 0x01234567u, 0xF);
      ObiMaster::Ev w = write_reg(kvregs::KEY, 0xBEEFu, 0xF);
      assert_always(!w.err, "regs: write answered err");
      assert_always(w.resp_cyc == w.sent_cyc, "regs: expected same-tick write response");
      ObiMaster::Ev r = read_reg(kvregs::VALUE_LO);
      assert_always(r.rdata == 0x8765FFFFu && !r.err, "regs: VALUE_LO readback");
      assert_always(r.resp_cyc == r.sent_cyc, "regs: expected same-tick read response");
      assert_always(read_reg(kvregs::VALUE_HI).rdata == 0x01234567u, "regs: VALUE_HI readback");
      assert_always(read_reg(kvregs::KEY).rdata == 0xBEEFu, "regs: KEY readback");
      assert_always(c->value_reg() == 0x012345678765FFFFull, "regs: 64-bit value assembly");
      assert_always(read_reg(kvregs::OPERATION).rdata == 0, "regs: OPERATION not NOOP");
      assert_always(c->ctrl().idle() && c->slots().used_count() == 0, "regs: operand writes touched the engine");
      return true;
    }
    if (s == "bus_byte_enable") {
      write_reg(kvregs::KEY, 0x11223344u, 0xF);
      write_reg(kvregs::KEY, 0xAABBCCDDu, 0x5); // lanes 0 and 2
      assert_always(read_reg(kvregs::KEY).rdata == 0x11BB33DDu, "be: lanes 0/2 merge");
      write_reg(kvregs::KEY, 0xFFFFFFFFu, 0x0);
      assert_always(read_reg(kvregs::KEY).rdata == 0x11BB33DDu, "be: be=0 must not write");
      write_reg(kvregs::VALUE_HI, 0xA5000000u, 0x8);
      assert_always(c->value_reg() == 0xA500000000000000ull, "be: VALUE_HI top lane");
      return true;
    }
    if (s == "bus_unmapped") {
      write_reg(kvregs::KEY, 0x1234u, 0xF);
      for (uint32_t a : {0x1Cu, 0x20u, 0x40u, 0x02u, 0xFFCu}) {
        ObiMaster::Ev r = read_reg(a);
        assert_always(r.rdata == 0 && !r.err, "unmapped: read must return 0 without error");
        ObiMaster::Ev w = write_reg(a, 0xDEADBEEFu, 0xF);
        assert_always(!w.err, "unmapped: write must complete without error");
      }
      assert_always(read_reg(kvregs::KEY).rdata == 0x1234u, "unmapped: side effect on KEY");
      assert_always(c->slots().used_count() == 0 && c->ctrl().idle(), "unmapped: side effect on engine");
      assert_always(c->bus_stats().unmapped == 10, "unmapped: count");
      return true;
    }
    if (s == "bus_readonly") {
      command(Opcode::Upsert, 0x55, 0x66);
      const uint32_t st = read_reg(kvregs::STATUS).rdata;
      ObiMaster::Ev w = write_reg(kvregs::STATUS, 0u, 0xF);
      assert_always(!w.err, "readonly: write must complete");
      assert_always(read_reg(kvregs::STATUS).rdata == st, "readonly: STATUS changed");
      write_reg(kvregs::RESULT_LO, 0u, 0xF);
      assert_always(read_reg(kvregs::RESULT_LO).rdata == 0x66u, "readonly: RESULT_LO changed");
      return true;
    }
    if (s == "kv_e2e") {
      assert_always(c->slots().used_count() == 0, "e2e: not empty after reset");
      BusOutcome o = command(Opcode::Upsert, 0xBEEF, 0x8765FFFFull);
      assert_always(o.status.done && !o.status.error && o.status.state == 0, "e2e: upsert status");
      assert_always(o.result == 0x8765FFFFull, "e2e: upsert read-back");
      assert_always(c->slots().used_count() == 1, "e2e: popcount after upsert");
      o = command(Opcode::Get, 0xBEEF, 0);
      assert_always(o.status.done && o.status.hit && o.result == 0x8765FFFFull, "e2e: get after upsert");
      o = command(Opcode::Delete, 0xBEEF, 0);
      assert_always(o.status.done && !o.status.error, "e2e: delete status");
      assert_always(c->slots().used_count() == 0, "e2e: popcount after delete");
      o = command(Opcode::Get, 0xBEEF, 0);
      assert_always(o.status.done && !o.status.hit && !o.status.error, "e2e: get after delete");
      kvcam::verify_and_report_postmortem(c->slots(), c->ctrl(), 0, (int)c->cycle());
      return true;
    }
    if (s == "kv_sequential") {
      const KeyWord keys[3] = {0x42, 0x99, 0x55};
      for (int i = 0; i < 3; ++i) {
        BusOutcome o = command(Opcode::Upsert, keys[i], 0xCAFE0000ull + i);
        assert_always(o.status.done, "sequential: upsert failed");
        assert_always(c->slots().used_entries() == kvcam::full_mask(i + 1), "sequential: not at lowest free index");
      }
      for (int i = 0; i < 3; ++i) {
        BusOutcome o = command(Opcode::Get, keys[i], 0);
        assert_always(o.status.hit && o.result == 0xCAFE0000ull + i, "sequential: readback");
      }
      return true;
    }
    if (s == "kv_update") {
      command(Opcode::Upsert, 0x10, 0x1);
      command(Opcode::Upsert, 0x20, 0x2);
      BusOutcome o = command(Opcode::Upsert, 0x10, 0xFFFFFFFF00000003ull);
      assert_always(o.status.done && o.status.hit, "update: STATUS.hit must flag an update");
      assert_always(o.result == 0xFFFFFFFF00000003ull, "update: read-back");
      assert_always(c->slots().used_count() == 2 && kvcam::keys_unique(c->slots()), "update: duplicate inserted");
      return true;
    }
    if (s == "kv_full") {
      const int n = cfg.num_slots;
      for (int i = 0; i < n; ++i) {
        assert_always(command(Opcode::Upsert, 0x1000 + i, i).status.done, "full: fill");
      }
      const SlotMask before = c->slots().used_entries();
      assert_always(before == kvcam::full_mask(n), "full: occupancy not all-ones");
      BusOutcome o = command(Opcode::Upsert, 0xFFFF, 0x1);
      assert_always(o.status.error && !o.status.done && o.status.state == 0, "full: capacity exhaustion must latch error");
      assert_always(c->slots().used_entries() == before, "full: occupancy changed");
      assert_always(!command(Opcode::Get, 0xFFFF, 0).status.hit, "full: key stored anyway");
      o = command(Opcode::Delete, 0x1000, 0);
      assert_always(o.status.done, "full: delete to make room");
      o = command(Opcode::Upsert, 0xFFFF, 0x1);
      assert_always(o.status.done && c->slots().occupied(0), "full: freed slot 0 not reused");
      kvcam::verify_and_report_postmortem(c->slots(), c->ctrl(), n, (int)c->cycle());
      return true;
    }
    if (s == "kv_delete_miss") {
      command(Opcode::Upsert, 0x7, 0x70);
      const SlotMask before = c->slots().used_entries();
      BusOutcome o = command(Opcode::Delete, 0x8, 0);
      assert_always(o.status.error && !o.status.done && !o.status.hit, "delete_miss: status");
      assert_always(c->slots().used_entries() == before, "delete_miss: occupancy changed");
      o = command(Opcode::Delete, 0x8, 0);
      assert_always(o.status.error && c->slots().used_entries() == before, "delete_miss: retry not idempotent");
      assert_always(command(Opcode::Get, 0x7, 0).status.hit, "delete_miss: engine unusable afterwards");
      return true;
    }
    if (s == "kv_busy_buffer") {
      soc.set_busy_policy(BusyWritePolicy::Buffer);
      m->enqueue_write(kvregs::VALUE_LO, 0xAAAAu);
      m->enqueue_write(kvregs::KEY, 0xA);
      m->enqueue_write(kvregs::OPERATION, static_cast<uint32_t>(Opcode::Upsert));
      m->enqueue_write(kvregs::KEY, 0xB);        // lands while the UPSERT runs
      m->enqueue_write(kvregs::VALUE_LO, 0xBBBBu);
      m->enqueue_poll_idle(cfg.poll_budget);
      assert_always(drain(4 + 2 + cfg.poll_budget), "busy_buffer: script did not drain");
      for (const auto& e : m->results()) assert_always(!e.err, "busy_buffer: write rejected");
      assert_always(c->slots().lookup(0xA).value == 0xAAAAu, "busy_buffer: in-flight op used new operands");
      assert_always(!c->slots().lookup(0xB).hit, "busy_buffer: buffered key applied early");
      assert_always(c->key_reg() == 0xB, "busy_buffer: KEY not buffered");
      BusOutcome o = command(Opcode::Upsert, 0xB, 0xBBBB);
      assert_always(o.status.done && c->slots().lookup(0xB).hit, "busy_buffer: next op");
      return true;
    }
    if (s == "kv_busy_reject") {
      soc.set_busy_policy(BusyWritePolicy::Reject);
      m->enqueue_write(kvregs::VALUE_LO, 0xAAAAu);
      m->enqueue_write(kvregs::KEY, 0xA);
      m->enqueue_write(kvregs::OPERATION, static_cast<uint32_t>(Opcode::Upsert));
      m->enqueue_write(kvregs::KEY, 0xB);
      m->enqueue_read(kvregs::STATUS);             // reads are never rejected
      m->enqueue_poll_idle(cfg.poll_budget);
      m->enqueue_write(kvregs::KEY, 0xC);          // idle again: accepted
      assert_always(drain(4 + 3 + cfg.poll_budget), "busy_reject: script did not drain");
      const auto& rs = m->results();
      assert_always(rs.size() == 7, "busy_reject: event count");
      assert_always(!rs[0].err && !rs[1].err && !rs[2].err, "busy_reject: idle writes rejected");
      assert_always(rs[3].err, "busy_reject: busy KEY write must answer err=1");
      assert_always(!rs[4].err && kvregs::decode_status(rs[4].rdata).state == 2, "busy_reject: STATUS read while PUT");
      assert_always(!rs[6].err && c->key_reg() == 0xC, "busy_reject: write after completion");
      assert_always(c->slots().lookup(0xA).hit && c->bus_stats().rejected == 1, "busy_reject: in-flight op disturbed");
      soc.set_busy_policy(cfg.busy_writes);
      return true;
    }
    if (s == "kv_abort") {
      m->enqueue_write(kvregs::KEY, 0x77);
      m->enqueue_write(kvregs::OPERATION, static_cast<uint32_t>(Opcode::Upsert));
      assert_always(drain(4), "abort: setup");
      Sim::run(); log("\n");                       // dispatched, UPSERT in START
      assert_always(c->ctrl().state() == Controller::State::Put, "abort: not in PUT");
      c->request_abort();
      Sim::run(); log("\n");
      const kvregs::StatusBits st = kvregs::decode_status(read_reg(kvregs::STATUS).rdata);
      assert_always(st.state == 0 && !st.done && !st.error, "abort: STATUS after abort");
      assert_always(c->slots().used_count() == 0 && c->ctrl().stats().aborts == 1, "abort: write committed");
      BusOutcome o = command(Opcode::Upsert, 0x77, 0x1);
      assert_always(o.status.done && c->slots().used_count() == 1, "abort: engine unusable afterwards");
      return true;
    }
    if (s == "kv_abort_pending") {
      m->enqueue_write(kvregs::KEY, 0x77);
      m->enqueue_write(kvregs::OPERATION, static_cast<uint32_t>(Opcode::Upsert));
      assert_always(drain(4), "abort_pending: setup");
      assert_always(c->ctrl().idle(), "abort_pending: dispatched early");
      c->request_abort();                          // lands on the dispatch edge
      for (int i = 0; i < 8; ++i) { Sim::run(); log("\n"); }
      assert_always(c->ctrl().idle(), "abort_pending: controller left IDLE");
      assert_always(c->slots().used_count() == 0 && !c->slots().lookup(0x77).hit, "abort_pending: cancelled upsert committed");
      assert_always(c->ctrl().stats().aborts == 1, "abort_pending: abort not counted");
      const kvregs::StatusBits st = kvregs::decode_status(read_reg(kvregs::STATUS).rdata);
      assert_always(!st.done && !st.error, "abort_pending: STATUS after abort");
      BusOutcome o = command(Opcode::Upsert, 0x77, 0x1);
      assert_always(o.status.done && c->slots().used_count() == 1, "abort_pending: engine unusable afterwards");
      return true;
    }
    if (s == "kv_reset") {
      for (int i = 0; i < 3; ++i) command(Opcode::Upsert, 0x300 + i, 0x1111u * (i + 1));
      write_reg(kvregs::KEY, 0xABCD, 0xF);
      soc.set_rst(true);
      Sim::run(); log("\n");
      Sim::run(); log("\n");
      soc.set_rst(false);
      assert_always(c->slots().used_entries() == 0, "reset: occupancy not cleared");
      assert_always(kvcam::free_slots_clear(c->slots()), "reset: slot contents not cleared");
      assert_always(c->ctrl().idle() && c->ctrl().upsert_fsm().state() == UpsertFsm::State::Start, "reset: controller not idle");
      assert_always(read_reg(kvregs::STATUS).rdata == 0 && read_reg(kvregs::KEY).rdata == 0, "reset: registers not cleared");
      assert_always(!command(Opcode::Get, 0x300, 0).status.hit, "reset: key survived");
      return true;
    }
    if (s == "kv_console_reset") {
      kvsoc::ConsoleState state(soc);
      BusOutcome o;
      assert_always(kvsoc::issue_command(state, Opcode::Upsert, 0x500, 0x5, &o), "console_reset: put");
      assert_always(kvsoc::issue_command(state, Opcode::Upsert, 0x501, 0x6, &o), "console_reset: put");
      assert_always(kvsoc::issue_command(state, Opcode::Get, 0x501, 0, &o) && o.result == 0x6, "console_reset: get");
      write_reg(kvregs::VALUE_HI, 0x1234u, 0xF);
      const int before = state.cycle;
      kvsoc::reset_soc(state);
      assert_always(state.cycle == before + 2, "console_reset: reset must span two cycles");
      assert_always(c->slots().used_entries() == 0 && kvcam::free_slots_clear(c->slots()), "console_reset: slots not cleared");
      assert_always(c->status_word() == 0 && c->value_reg() == 0 && c->key_reg() == 0, "console_reset: registers not cleared");
      assert_always(kvsoc::issue_command(state, Opcode::Get, 0x500, 0, &o), "console_reset: reset input not released");
      assert_always(o.status.done && !o.status.hit, "console_reset: key survived");
      return true;
    }
    if (s == "kv_timing") {
      // polls until IDLE: operation latency as seen from the bus
      command(Opcode::Upsert, 0x1, 0x2);
      assert_always(last_command_outcome(*m).polls == 4, "timing: UPSERT polls");
      assert_always(command(Opcode::Get, 0x1, 0).polls == 2, "timing: GET polls");
      assert_always(command(Opcode::Delete, 0x1, 0).polls == 3, "timing: DELETE polls");
      assert_always(command(Opcode::Delete, 0x1, 0).polls == 3, "timing: DELETE miss polls");
      assert_always(command(Opcode::Get, 0x1, 0).polls <= cfg.poll_budget, "timing: over budget");
      return true;
    }
    return false;
  };

  if (is_bus || is_kv) {
    bool ok = run_suite(S);
    assert_always(ok, "unknown or failed -suite");
    cout << "PASS " << S << endl;
    if (steps <= 0) return 0;
  }

  // **************
  // Step 7: Console, batch (-steps=N) or interactive (Enter to step)
  // **************
  if (S == "console") {
    kvsoc::ConsoleState state(soc);
    kvsoc::run_console(state);
    return 0;
  }

  cout << "Press return to advance a clock cycle" << endl;
  cout << "Press 0 to reset" << endl;
  cout << "Press \"q\" to quit" << endl;
  if (steps > 0) {
    for (int i = 0; i < steps; ++i) {
      Sim::run();
      log("\n");
    }
    return 0;
  }

  for (;;) { // interactive
    char buff[64];
    printf("> ");
    if (!fgets(buff, 64, stdin)) break;
    if (*buff == 'q')
      break;
    else if (*buff == '0')
      Sim::reset();
    else
      Sim::run();
    log("\n");
  }
  return 0;
}
