// **********************************************************************
// kvcam/src/tb_kvcam.cpp
// **********************************************************************
// S Magierowski Jan 20 2026
/*
Component testbench for the key/value CAM engine (no bus).
Each suite drives SlotArray / the sub-machines / the Controller cycle by
cycle and checks outputs with assert_always. -suite=all runs every suite.

to configure, build, and run:
% cmake -S . -B build
% cmake --build build --target tb_kvcam -j
build % ./tb_kvcam -suite=eng_e2e
*/
#include <descore/Parameter.hpp>
#include "SlotArray.hpp"
#include "GetFsm.hpp"
#include "UpsertFsm.hpp"
#include "DelFsm.hpp"
#include "Controller.hpp"
#include "Invariants.hpp"

#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

// **************
// Parameters (CLI flags): name, default value, help text
// **************
StringParameter(suite,       "all",  "Suite name, or all");
IntParameter(slots,          16,     "Slots in the engine under test (1..64)");
IntParameter(poll_budget,    20,     "Cycles allowed for one operation to return to IDLE");
IntParameter(rng_seed,       1,      "Seed for the random-traffic suite");
IntParameter(random_ops,     2000,   "Operations issued by eng_random");
BoolParameter(showcontexts,  false,  "List component instance names (contexts) and exit");

namespace
{

  /* everything a suite can poke at; reset between suites */
  struct Bench {
    SlotArray  &ut_slots;  // standalone array for slot_* suites
    GetFsm     &ut_get;
    UpsertFsm  &ut_upsert;
    DelFsm     &ut_del;
    SlotArray  &eng_slots; // array behind the controller
    Controller &ctrl;
    int cycle = 0;

    void reset() {
      ut_slots.reset(); ut_get.reset(); ut_upsert.reset(); ut_del.reset();
      eng_slots.reset(); ctrl.reset();
      cycle = 0;
    }
  };

  /* one controller clock with the given inputs */
  static void clock_ctrl(Bench &b, const Controller::Inputs &in) {
    b.ctrl.tick(in);
    b.cycle++;
  }

  /* strobe an opcode for one cycle then clock until IDLE; returns cycles spent, -1 on timeout */
  static int run_op(Bench &b, Opcode op, KeyWord key, ValueWord value = 0) {
    Controller::Inputs in;
    in.start = true; in.op = op; in.key = key; in.value = value;
    clock_ctrl(b, in);
    int n = 1;
    while (!b.ctrl.idle()) {
      if (n > (int)poll_budget) return -1;
      clock_ctrl(b, Controller::Inputs{});
      n++;
    }
    return n;
  }

  static int used(Bench &b) { return b.eng_slots.used_count(); }

  // ****************************************************
  // SlotArray
  // ****************************************************
  static bool slot_reset(Bench &b) {
    SlotArray &s = b.ut_slots;
    s.write(kvcam::index_to_onehot(0), 0xF, 0xF); s.tick();
    assert_always(s.used_count() == 1, "slot_reset: write before reset not taken");
    s.reset();
    assert_always(s.used_entries() == 0, "slot_reset: used entries not cleared");
    for (int i = 0; i < s.num_slots(); ++i) {
      assert_always(s.slot(i).key == 0 && s.slot(i).value == 0, "slot_reset: cell not cleared");
    }
    const SlotView v = s.read_port(false, 0, 0xF);
    assert_always(v.key == 0 && v.value == 0, "slot_reset: read port not idle");
    return true;
  }

  static bool slot_write_read(Bench &b) {
    SlotArray &s = b.ut_slots;
    s.write(kvcam::index_to_onehot(0), 0x5, 0xA);
    assert_always(!s.lookup(0x5).hit, "slot_write_read: write visible before the edge");
    s.tick();
    const LookupResult r = s.lookup(0x5);
    assert_always(r.hit && r.idx == 0b1 && r.value == 0xA, "slot_write_read: readback by key");
    assert_always(!s.lookup(0x6).hit && s.lookup(0x6).value == 0, "slot_write_read: miss must read 0");
    return true;
  }

  static bool slot_used_entries(Bench &b) {
    SlotArray &s = b.ut_slots;
    for (int i = 0; i < s.num_slots(); ++i) {
      s.write(kvcam::index_to_onehot(i), KeyWord(i + 1), ValueWord(i + 1) * 2);
      s.tick();
      assert_always(s.used_count() == i + 1, "slot_used_entries: count after write");
      assert_always(s.lookup(KeyWord(i + 1)).value == ValueWord(i + 1) * 2, "slot_used_entries: readback by key");
    }
    return true;
  }

  static bool slot_read_by_index(Bench &b) {
    SlotArray &s = b.ut_slots;
    for (int i = 0; i < s.num_slots(); ++i) {
      s.write(kvcam::index_to_onehot(i), KeyWord(i + 1), ValueWord(i + 1) * 2);
      s.tick();
    }
    for (int i = 0; i < s.num_slots(); ++i) {
      const SlotView v = s.read_port(true, kvcam::index_to_onehot(i), 0);
      assert_always(v.key == KeyWord(i + 1) && v.value == ValueWord(i + 1) * 2, "slot_read_by_index: cell mismatch");
    }
    // select=1 routes the addressed cell even when key_in matches another one
    const SlotView v = s.read_port(true, 0b1, 2);
    assert_always(v.key == 1 && v.value == 2, "slot_read_by_index: select must win over key");
    return true;
  }

  static bool slot_lowest_free(Bench &b) {
    SlotArray &s = b.ut_slots;
    AllocResult a = s.allocate_free();
    assert_always(a.found && a.idx == 0b1, "slot_lowest_free: empty array must give slot 0");
    for (int i = 0; i < 3; ++i) { s.write(kvcam::index_to_onehot(i), KeyWord(0x10 + i), 1); s.tick(); }
    a = s.allocate_free();
    assert_always(a.found && a.idx == 0b1000, "slot_lowest_free: used=0b0111 must give 0b1000");
    s.erase(0b10); s.tick();
    a = s.allocate_free();
    assert_always(a.found && a.idx == 0b10, "slot_lowest_free: hole at 1 must be reused first");
    return true;
  }

  static bool slot_full(Bench &b) {
    SlotArray &s = b.ut_slots;
    for (int i = 0; i < s.num_slots(); ++i) { s.write(kvcam::index_to_onehot(i), KeyWord(i), 0); s.tick(); }
    assert_always(s.used_entries() == kvcam::full_mask(s.num_slots()), "slot_full: occupancy not all-ones");
    const AllocResult a = s.allocate_free();
    assert_always(!a.found && a.idx == 0, "slot_full: allocate_free must fail");
    return true;
  }

  static bool slot_erase(Bench &b) {
    SlotArray &s = b.ut_slots;
    s.write(0b100, 0x77, 0x1234); s.tick();
    s.erase(0b100);
    assert_always(s.lookup(0x77).hit, "slot_erase: erase visible before the edge");
    s.tick();
    assert_always(!s.lookup(0x77).hit && s.used_count() == 0, "slot_erase: slot still live");
    assert_always(s.slot(2).key == 0 && s.slot(2).value == 0, "slot_erase: slot not zeroed");
    return true;
  }

  // ****************************************************
  // GET sub-machine
  // ****************************************************
  static bool get_hit_miss(Bench &b) {
    GetFsm &g = b.ut_get;
    GetFsm::Inputs in; in.en = true; in.hit = true; in.value = 0x1234;
    GetFsm::Outputs o = g.outputs(in);
    assert_always(o.cmd.done && !o.cmd.error && o.hit && o.value == 0x1234, "get_hit_miss: hit");
    g.tick(in);
    in.hit = false;
    o = g.outputs(in);
    assert_always(o.cmd.done && !o.cmd.error && !o.hit && o.value == 0, "get_hit_miss: miss is not an error");
    g.tick(in);
    in.en = false;
    o = g.outputs(in);
    assert_always(!o.cmd.done, "get_hit_miss: disabled machine reports nothing");
    assert_always(g.lookups() == 2, "get_hit_miss: lookup count");
    return true;
  }

  // ****************************************************
  // UPSERT sub-machine
  // ****************************************************
  static UpsertFsm::Inputs upsert_in(bool hit, SlotMask idx, bool free_found, SlotMask free_idx) {
    UpsertFsm::Inputs in;
    in.en = true; in.hit = hit; in.idx_in = idx; in.free_found = free_found; in.free_idx = free_idx;
    return in;
  }

  static bool upsert_paths(Bench &b) {
    UpsertFsm &u = b.ut_upsert;
    UpsertFsm::Inputs enter = upsert_in(false, 0, true, 0b1);
    enter.enter = true;

    // update path: key exists at slot 2, free slot offered is ignored
    u.tick(enter);
    u.tick(upsert_in(true, 0b100, true, 0b1));
    assert_always(u.state() == UpsertFsm::State::Update, "upsert_paths: hit must go to UPDATE");
    UpsertFsm::Outputs o = u.outputs();
    assert_always(o.write_out && o.idx_out == 0b100 && !o.cmd.done, "upsert_paths: UPDATE strobe");
    u.tick(upsert_in(false, 0, false, 0));
    o = u.outputs();
    assert_always(u.state() == UpsertFsm::State::Done && o.cmd.done && o.op_succ && o.existed, "upsert_paths: DONE after UPDATE");
    assert_always(!o.write_out && o.select_out && o.idx_out == 0b100, "upsert_paths: DONE read-back");
    u.tick(upsert_in(false, 0, false, 0));
    assert_always(u.state() == UpsertFsm::State::Start, "upsert_paths: back to START");

    // insert path
    u.tick(enter);
    u.tick(upsert_in(false, 0, true, 0b1000));
    o = u.outputs();
    assert_always(u.state() == UpsertFsm::State::Insert && o.write_out && o.idx_out == 0b1000, "upsert_paths: INSERT strobe");
    u.tick(upsert_in(false, 0, false, 0));
    o = u.outputs();
    assert_always(o.cmd.done && !o.existed, "upsert_paths: insert is not an update");
    u.tick(upsert_in(false, 0, false, 0));

    // full path
    u.tick(enter);
    u.tick(upsert_in(false, 0, false, 0));
    o = u.outputs();
    assert_always(u.state() == UpsertFsm::State::Full, "upsert_paths: miss+full must go to FULL");
    assert_always(o.cmd.error && !o.cmd.done && !o.op_succ && !o.write_out && o.idx_out == 0, "upsert_paths: FULL outputs");
    u.tick(upsert_in(false, 0, false, 0));
    assert_always(u.state() == UpsertFsm::State::Start, "upsert_paths: FULL returns to START");
    return true;
  }

  static bool upsert_cancel(Bench &b) {
    UpsertFsm &u = b.ut_upsert;
    UpsertFsm::Inputs enter = upsert_in(false, 0, true, 0b1);
    enter.enter = true;
    u.tick(enter);
    u.tick(upsert_in(false, 0, true, 0b10));
    assert_always(u.state() == UpsertFsm::State::Insert, "upsert_cancel: setup");
    UpsertFsm::Inputs frozen = upsert_in(false, 0, true, 0b10);
    frozen.en = false;
    u.tick(frozen);
    assert_always(u.state() == UpsertFsm::State::Insert && u.outputs().write_out, "upsert_cancel: en=0 must hold state and outputs");
    u.tick(enter);
    const UpsertFsm::Outputs o = u.outputs();
    assert_always(u.state() == UpsertFsm::State::Start && !o.write_out && o.idx_out == 0, "upsert_cancel: enter must force START");
    return true;
  }

  // ****************************************************
  // DELETE sub-machine
  // ****************************************************
  static DelFsm::Inputs del_in(bool en, bool enter, bool hit, SlotMask idx) {
    DelFsm::Inputs in; in.en = en; in.enter = enter; in.hit = hit; in.idx_in = idx;
    return in;
  }

  static void check_del_idle(const DelFsm &d, const char *msg) {
    const DelFsm::Outputs o = d.outputs();
    assert_always(!o.cmd.done && !o.cmd.error && !o.delete_out && o.idx_out == 0, msg);
  }

  static bool del_hit(Bench &b) {
    DelFsm &d = b.ut_del;
    d.tick(del_in(true, true, false, 0));
    assert_always(d.state() == DelFsm::State::Start, "del_hit: START after enter");
    check_del_idle(d, "del_hit: START outputs idle");
    d.tick(del_in(true, false, true, 0b0010));
    const DelFsm::Outputs o = d.outputs();
    assert_always(d.state() == DelFsm::State::Delete, "del_hit: hit must go to DELETE");
    assert_always(o.delete_out && o.idx_out == 0b0010 && o.cmd.done && !o.cmd.error, "del_hit: DELETE outputs");
    d.tick(del_in(true, false, false, 0));
    assert_always(d.state() == DelFsm::State::Start, "del_hit: back to START");
    check_del_idle(d, "del_hit: outputs idle after DELETE");
    return true;
  }

  static bool del_miss(Bench &b) {
    DelFsm &d = b.ut_del;
    d.tick(del_in(true, true, false, 0));
    d.tick(del_in(true, false, false, 0b0101)); // idx on a miss must not propagate
    const DelFsm::Outputs o = d.outputs();
    assert_always(d.state() == DelFsm::State::Error, "del_miss: miss must go to ERROR");
    assert_always(!o.delete_out && o.idx_out == 0 && !o.cmd.done && o.cmd.error, "del_miss: ERROR outputs");
    d.tick(del_in(true, false, false, 0));
    assert_always(d.state() == DelFsm::State::Start, "del_miss: back to START");
    check_del_idle(d, "del_miss: outputs idle after ERROR");
    return true;
  }

  static bool del_freeze(Bench &b) {
    DelFsm &d = b.ut_del;
    for (int i = 0; i < 4; ++i) {
      d.tick(del_in(false, false, true, 0b1));
      assert_always(d.state() == DelFsm::State::Start, "del_freeze: disabled machine left START");
    }
    d.tick(del_in(true, true, false, 0));
    d.tick(del_in(true, false, true, 0b1000));
    for (int i = 0; i < 3; ++i) {
      d.tick(del_in(false, false, false, 0));
      const DelFsm::Outputs o = d.outputs();
      assert_always(d.state() == DelFsm::State::Delete && o.delete_out && o.idx_out == 0b1000, "del_freeze: outputs must be held");
    }
    return true;
  }

  static bool del_enter_cancel(Bench &b) {
    DelFsm &d = b.ut_del;
    d.tick(del_in(true, true, false, 0));
    d.tick(del_in(true, false, false, 0));
    assert_always(d.state() == DelFsm::State::Error, "del_enter_cancel: setup");
    d.tick(del_in(true, true, true, 0b1));
    assert_always(d.state() == DelFsm::State::Start, "del_enter_cancel: enter must force START");
    check_del_idle(d, "del_enter_cancel: outputs idle after enter");
    // sequential deletes alternating hit / miss
    for (int i = 0; i < 6; ++i) {
      const bool hit = (i % 2) == 0;
      d.tick(del_in(true, true, false, 0));
      d.tick(del_in(true, false, hit, 0b0010));
      const DelFsm::Outputs o = d.outputs();
      assert_always(o.cmd.done == hit && o.cmd.error == !hit, "del_enter_cancel: alternating result");
      d.tick(del_in(true, false, false, 0));
    }
    return true;
  }

  static bool del_pulse(Bench &b) {
    DelFsm &d = b.ut_del;
    std::vector<bool> trace_out;
    d.tick(del_in(true, true, false, 0));
    trace_out.push_back(d.outputs().delete_out);
    d.tick(del_in(true, false, true, 0b1));
    trace_out.push_back(d.outputs().delete_out);
    for (int i = 0; i < 4; ++i) {
      d.tick(del_in(true, false, false, 0));
      trace_out.push_back(d.outputs().delete_out);
    }
    int high = 0;
    for (bool v : trace_out) high += v ? 1 : 0;
    assert_always(high == 1 && !trace_out[0] && trace_out[1] && !trace_out[2], "del_pulse: delete_out must be a one-cycle pulse");
    return true;
  }

  // ****************************************************
  // Controller
  // ****************************************************
  static bool ctrl_idle_noop(Bench &b) {
    for (int i = 0; i < 3; ++i) {
      Controller::Inputs in; in.start = true; in.op = Opcode::Noop;
      clock_ctrl(b, in);
      const Controller::Outputs o = b.ctrl.outputs();
      assert_always(o.state == Controller::State::Idle, "ctrl_idle_noop: NOOP left IDLE");
      assert_always(o.idx_out == 0 && !o.write_out && !o.select_out && !o.ready_out && !o.delete_out, "ctrl_idle_noop: outputs not zero");
    }
    assert_always(used(b) == 0, "ctrl_idle_noop: storage touched");
    return true;
  }

  static bool ctrl_lowest_free(Bench &b) {
    for (int i = 0; i < 3; ++i) assert_always(run_op(b, Opcode::Upsert, 0x100 + i, i) > 0, "ctrl_lowest_free: setup");
    assert_always(b.eng_slots.used_entries() == 0b0111, "ctrl_lowest_free: setup occupancy");
    Controller::Inputs in; in.start = true; in.op = Opcode::Upsert; in.key = 0x200; in.value = 0x99;
    clock_ctrl(b, in);
    assert_always(b.ctrl.state() == Controller::State::Put, "ctrl_lowest_free: not in PUT");
    bool seen = false;
    for (int i = 0; i < (int)poll_budget && !b.ctrl.idle(); ++i) {
      const Controller::Outputs o = b.ctrl.outputs();
      if (o.write_out) {
        assert_always(o.idx_out == 0b1000, "ctrl_lowest_free: insert must target idx_out=0b1000");
        seen = true;
      }
      clock_ctrl(b, Controller::Inputs{});
    }
    assert_always(seen, "ctrl_lowest_free: no write strobe");
    assert_always(b.eng_slots.used_entries() == 0b1111, "ctrl_lowest_free: occupancy after insert");
    return true;
  }

  static bool ctrl_write_pulse(Bench &b) {
    Controller::Inputs in; in.start = true; in.op = Opcode::Upsert; in.key = 0x42; in.value = 0xDEADBEEF;
    std::vector<bool> w;
    w.push_back(b.ctrl.outputs().write_out);
    clock_ctrl(b, in);
    for (int i = 0; i < 6; ++i) {
      w.push_back(b.ctrl.outputs().write_out);
      clock_ctrl(b, Controller::Inputs{});
    }
    int high = 0; size_t at = 0;
    for (size_t i = 0; i < w.size(); ++i) if (w[i]) { high++; at = i; }
    assert_always(high == 1, "ctrl_write_pulse: write_out must be high exactly one cycle");
    assert_always(at > 0 && at + 1 < w.size(), "ctrl_write_pulse: pulse at the sampling edge");
    assert_always(!w[at - 1] && !w[at + 1], "ctrl_write_pulse: pulse not isolated");
    return true;
  }

  static bool ctrl_full_reject(Bench &b) {
    const int n = b.eng_slots.num_slots();
    for (int i = 0; i < n; ++i) assert_always(run_op(b, Opcode::Upsert, 0x1000 + i, i) > 0, "ctrl_full_reject: fill");
    assert_always(b.eng_slots.used_entries() == kvcam::full_mask(n), "ctrl_full_reject: not full");
    const SlotMask before = b.eng_slots.used_entries();
    const int cycles = run_op(b, Opcode::Upsert, 0xFFFF, 0x1);
    assert_always(cycles > 0, "ctrl_full_reject: controller did not return to IDLE");
    const OpResult &r = b.ctrl.result();
    assert_always(r.error && !r.done && !r.hit, "ctrl_full_reject: capacity exhaustion must latch error");
    assert_always(b.eng_slots.used_entries() == before, "ctrl_full_reject: occupancy changed");
    assert_always(!b.eng_slots.lookup(0xFFFF).hit, "ctrl_full_reject: key written anyway");
    // an existing key still updates in place when full
    assert_always(run_op(b, Opcode::Upsert, 0x1000, 0xABCD) > 0, "ctrl_full_reject: update when full");
    assert_always(b.ctrl.result().done && b.ctrl.result().hit, "ctrl_full_reject: update must succeed");
    assert_always(b.eng_slots.lookup(0x1000).value == 0xABCD, "ctrl_full_reject: update lost");
    return true;
  }

  static bool ctrl_abort(Bench &b) {
    assert_always(run_op(b, Opcode::Upsert, 0x1, 0x11) > 0, "ctrl_abort: setup");
    // abort an insert before its commit cycle
    Controller::Inputs in; in.start = true; in.op = Opcode::Upsert; in.key = 0x2; in.value = 0x22;
    clock_ctrl(b, in);                 // IDLE -> PUT
    clock_ctrl(b, Controller::Inputs{}); // START -> INSERT
    assert_always(b.ctrl.outputs().write_out, "ctrl_abort: not at commit cycle");
    Controller::Inputs ab; ab.abort = true;
    clock_ctrl(b, ab);
    assert_always(b.ctrl.idle(), "ctrl_abort: controller must return to IDLE");
    assert_always(b.ctrl.upsert_fsm().state() == UpsertFsm::State::Start, "ctrl_abort: sub-machine not reset");
    assert_always(!b.eng_slots.lookup(0x2).hit && used(b) == 1, "ctrl_abort: in-flight write must be dropped");
    const OpResult &r = b.ctrl.result();
    assert_always(!r.done && !r.error, "ctrl_abort: aborted op reports neither done nor error");
    // abort after commit: the committed insert stays
    clock_ctrl(b, in);
    clock_ctrl(b, Controller::Inputs{});
    clock_ctrl(b, Controller::Inputs{}); // INSERT commits, -> DONE
    clock_ctrl(b, ab);
    assert_always(b.ctrl.idle() && b.eng_slots.lookup(0x2).hit && used(b) == 2, "ctrl_abort: committed write rolled back");
    assert_always(b.ctrl.stats().aborts == 2, "ctrl_abort: abort count");
    // the next request runs normally
    assert_always(run_op(b, Opcode::Get, 0x2) > 0 && b.ctrl.result().hit, "ctrl_abort: GET after abort");
    return true;
  }

  static bool ctrl_abort_start(Bench &b) {
    assert_always(run_op(b, Opcode::Upsert, 0x1, 0x11) > 0, "ctrl_abort_start: setup");
    Controller::Inputs in; in.start = true; in.op = Opcode::Upsert; in.key = 0x2; in.value = 0x22; in.abort = true;
    clock_ctrl(b, in);
    assert_always(b.ctrl.idle(), "ctrl_abort_start: start dispatched despite abort");
    assert_always(b.ctrl.stats().aborts == 1, "ctrl_abort_start: abort not counted");
    assert_always(!b.ctrl.result().done && !b.ctrl.result().error, "ctrl_abort_start: result not cleared");
    for (int i = 0; i < 6; ++i) clock_ctrl(b, Controller::Inputs{});
    assert_always(!b.eng_slots.lookup(0x2).hit && used(b) == 1, "ctrl_abort_start: cancelled upsert committed");
    // abort with no start and nothing in flight is a no-op
    Controller::Inputs ab; ab.abort = true;
    clock_ctrl(b, ab);
    assert_always(b.ctrl.idle() && b.ctrl.stats().aborts == 1, "ctrl_abort_start: idle abort counted");
    assert_always(run_op(b, Opcode::Get, 0x1) > 0 && b.ctrl.result().hit, "ctrl_abort_start: engine unusable afterwards");
    return true;
  }

  static bool ctrl_enable(Bench &b) {
    Controller::Inputs in; in.start = true; in.op = Opcode::Delete; in.key = 0x9;
    assert_always(run_op(b, Opcode::Upsert, 0x9, 0x90) > 0, "ctrl_enable: setup");
    clock_ctrl(b, in);
    clock_ctrl(b, Controller::Inputs{}); // START -> DELETE
    Controller::Inputs off; off.en = false;
    for (int i = 0; i < 5; ++i) {
      clock_ctrl(b, off);
      const Controller::Outputs o = b.ctrl.outputs();
      assert_always(o.state == Controller::State::Del && o.delete_out && o.idx_out == 0b1, "ctrl_enable: frozen outputs changed");
      assert_always(used(b) == 1, "ctrl_enable: frozen engine committed");
    }
    clock_ctrl(b, Controller::Inputs{});
    assert_always(b.ctrl.idle() && used(b) == 0, "ctrl_enable: delete did not resume");
    return true;
  }

  static bool ctrl_busy_ignores_start(Bench &b) {
    Controller::Inputs in; in.start = true; in.op = Opcode::Upsert; in.key = 0x31; in.value = 0x1;
    clock_ctrl(b, in);
    Controller::Inputs other; other.start = true; other.op = Opcode::Upsert; other.key = 0x32; other.value = 0x2;
    while (!b.ctrl.idle()) clock_ctrl(b, other); // key/value for the next op must not leak in
    assert_always(b.eng_slots.lookup(0x31).hit && !b.eng_slots.lookup(0x32).hit, "ctrl_busy_ignores_start: operands leaked");
    assert_always(b.ctrl.request().key == 0x31, "ctrl_busy_ignores_start: snapshot replaced");
    return true;
  }

  static bool ctrl_timing(Bench &b) {
    assert_always(run_op(b, Opcode::Get, 0x1) == 2 && b.ctrl.last_op_cycles() == 1, "ctrl_timing: GET is one cycle");
    assert_always(run_op(b, Opcode::Upsert, 0x1, 0x2) == 4, "ctrl_timing: UPSERT insert cycles");
    assert_always(run_op(b, Opcode::Upsert, 0x1, 0x3) == 4, "ctrl_timing: UPSERT update cycles");
    assert_always(run_op(b, Opcode::Delete, 0x1) == 3, "ctrl_timing: DELETE hit cycles");
    assert_always(run_op(b, Opcode::Delete, 0x1) == 3, "ctrl_timing: DELETE miss must cost the same");
    return true;
  }

  // ****************************************************
  // Engine scenarios
  // ****************************************************
  static bool eng_e2e(Bench &b) {
    assert_always(used(b) == 0, "eng_e2e: not empty after reset");
    assert_always(run_op(b, Opcode::Upsert, 0xBEEF, 0x8765FFFF) > 0, "eng_e2e: upsert timeout");
    assert_always(used(b) == 1, "eng_e2e: popcount after upsert");
    assert_always(run_op(b, Opcode::Get, 0xBEEF) > 0, "eng_e2e: get timeout");
    assert_always(b.ctrl.result().hit && b.ctrl.result().value == 0x8765FFFF, "eng_e2e: get after upsert");
    assert_always(run_op(b, Opcode::Delete, 0xBEEF) > 0, "eng_e2e: delete timeout");
    assert_always(b.ctrl.result().done && !b.ctrl.result().error, "eng_e2e: delete result");
    assert_always(used(b) == 0, "eng_e2e: popcount after delete");
    assert_always(run_op(b, Opcode::Get, 0xBEEF) > 0, "eng_e2e: get timeout");
    assert_always(!b.ctrl.result().hit && !b.ctrl.result().error && b.ctrl.result().done, "eng_e2e: get after delete");
    return true;
  }

  static bool eng_sequential(Bench &b) {
    const KeyWord keys[3] = {0x42, 0x99, 0x55};
    for (int i = 0; i < 3; ++i) {
      assert_always(run_op(b, Opcode::Upsert, keys[i], 0xCAFE0000u + i) > 0, "eng_sequential: timeout");
      assert_always(used(b) == i + 1, "eng_sequential: popcount");
      assert_always(b.eng_slots.lookup(keys[i]).idx == kvcam::index_to_onehot(i), "eng_sequential: not at lowest free index");
    }
    return true;
  }

  static bool eng_update_in_place(Bench &b) {
    assert_always(run_op(b, Opcode::Upsert, 0x10, 0x1) > 0, "eng_update_in_place: insert");
    assert_always(run_op(b, Opcode::Upsert, 0x20, 0x2) > 0, "eng_update_in_place: insert");
    const SlotMask at = b.eng_slots.lookup(0x10).idx;
    assert_always(run_op(b, Opcode::Upsert, 0x10, 0x3) > 0, "eng_update_in_place: update");
    assert_always(b.ctrl.result().hit && b.ctrl.result().value == 0x3, "eng_update_in_place: result");
    assert_always(used(b) == 2 && b.eng_slots.lookup(0x10).idx == at, "eng_update_in_place: slot moved or duplicated");
    assert_always(kvcam::keys_unique(b.eng_slots), "eng_update_in_place: duplicate key");
    return true;
  }

  static bool eng_delete_miss(Bench &b) {
    assert_always(run_op(b, Opcode::Upsert, 0x7, 0x70) > 0, "eng_delete_miss: setup");
    const SlotMask before = b.eng_slots.used_entries();
    assert_always(run_op(b, Opcode::Delete, 0x8) > 0, "eng_delete_miss: timeout");
    const OpResult &r = b.ctrl.result();
    assert_always(r.error && !r.done && !r.hit, "eng_delete_miss: result");
    assert_always(b.eng_slots.used_entries() == before, "eng_delete_miss: occupancy changed");
    assert_always(run_op(b, Opcode::Get, 0x7) > 0 && b.ctrl.result().hit, "eng_delete_miss: engine not usable afterwards");
    return true;
  }

  static bool eng_random(Bench &b) {
    std::mt19937 rng(static_cast<uint32_t>((int)rng_seed));
    std::unordered_map<KeyWord, ValueWord> model;
    const int cap = b.eng_slots.num_slots();
    int live = 0;
    for (int i = 0; i < (int)random_ops; ++i) {
      const KeyWord   key   = rng() % (KeyWord)(cap * 2); // enough keys to hit full
      const ValueWord value = (ValueWord(rng()) << 32) | rng();
      const int pick = rng() % 3;
      if (pick == 0) {
        assert_always(run_op(b, Opcode::Get, key) > 0, "eng_random: get timeout");
        auto it = model.find(key);
        assert_always(b.ctrl.result().hit == (it != model.end()), "eng_random: get hit mismatch");
        if (it != model.end()) assert_always(b.ctrl.result().value == it->second, "eng_random: get value mismatch");
      } else if (pick == 1) {
        assert_always(run_op(b, Opcode::Upsert, key, value) > 0, "eng_random: upsert timeout");
        const bool exists = model.count(key) != 0;
        if (exists || live < cap) {
          assert_always(b.ctrl.result().done, "eng_random: upsert failed with room");
          if (!exists) live++;
          model[key] = value;
        } else {
          assert_always(b.ctrl.result().error, "eng_random: full upsert did not error");
        }
      } else {
        assert_always(run_op(b, Opcode::Delete, key) > 0, "eng_random: delete timeout");
        const bool exists = model.erase(key) != 0;
        assert_always(b.ctrl.result().done == exists && b.ctrl.result().error == !exists, "eng_random: delete result mismatch");
        if (exists) live--;
      }
      assert_always(used(b) == live, "eng_random: occupancy invariant");
      assert_always(kvcam::keys_unique(b.eng_slots), "eng_random: key uniqueness");
    }
    kvcam::verify_and_report_postmortem(b.eng_slots, b.ctrl, live, b.cycle);
    return true;
  }

} // namespace

int main(int argc, char *argv[])
{
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Create components
  // **************
  SlotArray  ut_slots("ut_slots", (int)slots);
  GetFsm     ut_get("ut_get");
  UpsertFsm  ut_upsert("ut_upsert");
  DelFsm     ut_del("ut_del");
  SlotArray  eng_slots("slots", (int)slots);
  Controller ctrl("ctrl");
  ctrl.attach_slots(&eng_slots);

  if (showcontexts) {
    Sim::dumpComponentNames();
    return 0;
  }

  // **************
  // Step 3: Hook clock and initialize & reset simulator
  // **************
  Clock clk;
  ut_slots.clk << clk; ut_get.clk << clk; ut_upsert.clk << clk; ut_del.clk << clk;
  eng_slots.clk << clk; ctrl.clk << clk;
  clk.generateClock();
  Sim::init();
  Sim::reset();

  Bench bench{ut_slots, ut_get, ut_upsert, ut_del, eng_slots, ctrl};

  // **************
  // Step 4: Suite table
  // **************
  const std::map<std::string, std::function<bool(Bench &)>> suites = {
    {"slot_reset",              slot_reset},
    {"slot_write_read",         slot_write_read},
    {"slot_used_entries",       slot_used_entries},
    {"slot_read_by_index",      slot_read_by_index},
    {"slot_lowest_free",        slot_lowest_free},
    {"slot_full",               slot_full},
    {"slot_erase",              slot_erase},
    {"get_hit_miss",            get_hit_miss},
    {"upsert_paths",            upsert_paths},
    {"upsert_cancel",           upsert_cancel},
    {"del_hit",                 del_hit},
    {"del_miss",                del_miss},
    {"del_freeze",              del_freeze},
    {"del_enter_cancel",        del_enter_cancel},
    {"del_pulse",               del_pulse},
    {"ctrl_idle_noop",          ctrl_idle_noop},
    {"ctrl_lowest_free",        ctrl_lowest_free},
    {"ctrl_write_pulse",        ctrl_write_pulse},
    {"ctrl_full_reject",        ctrl_full_reject},
    {"ctrl_abort",              ctrl_abort},
    {"ctrl_abort_start",        ctrl_abort_start},
    {"ctrl_enable",             ctrl_enable},
    {"ctrl_busy_ignores_start", ctrl_busy_ignores_start},
    {"ctrl_timing",             ctrl_timing},
    {"eng_e2e",                 eng_e2e},
    {"eng_sequential",          eng_sequential},
    {"eng_update_in_place",     eng_update_in_place},
    {"eng_delete_miss",         eng_delete_miss},
    {"eng_random",              eng_random},
  };

  // **************
  // Step 5: Run the selected suite(s)
  // **************
  const std::string S = std::string(suite);
  if (S == "all") {
    for (const auto &entry : suites) {
      bench.reset();
      bool ok = entry.second(bench);
      assert_always(ok, "suite failed");
      std::cout << "PASS " << entry.first << std::endl;
    }
    return 0;
  }
  auto it = suites.find(S);
  assert_always(it != suites.end(), "unknown -suite");
  bench.reset();
  bool ok = it->second(bench);
  assert_always(ok, "suite failed");
  std::cout << "PASS " << S << std::endl;
  return 0;
}
