// **********************************************************************
// kvcam/src/Controller.cpp
// **********************************************************************
// S Magierowski Jan 15 2026
/*
One tick() is one clock:
  1. combinational: lookup/allocate against the pre-edge array, Moore outputs
     of the active sub-machine, strobes staged into the SlotArray
  2. edge: sub-machines, controller state, SlotArray commit
Only the active sub-machine is enabled, so the array has one driver.
*/
#include "Controller.hpp"

using namespace Cascade;

Controller::Controller(std::string /*name*/, IMPL_CTOR)
  : get_("get"), upsert_("upsert"), del_("del")
{
  get_.clk << clk; upsert_.clk << clk; del_.clk << clk;
}

Controller::State Controller::state_for(Opcode op) {
  switch (op) {
    case Opcode::Get:    return State::Get;
    case Opcode::Upsert: return State::Put;
    case Opcode::Delete: return State::Del;
    case Opcode::Noop:   break;
  }
  return State::Idle;
}

Controller::Outputs Controller::outputs() const {
  Outputs o{};
  o.state = state_;
  switch (state_) {
    case State::Get:
      o.ready_out = true;
      o.op_succ   = true;
      break;
    case State::Put: {
      const UpsertFsm::Outputs u = upsert_.outputs();
      o.idx_out    = u.idx_out;
      o.write_out  = u.write_out;
      o.select_out = u.select_out;
      o.ready_out  = u.rdy_out;
      o.op_succ    = u.op_succ;
      break;
    }
    case State::Del: {
      const DelFsm::Outputs d = del_.outputs();
      o.idx_out    = d.idx_out;
      o.delete_out = d.delete_out;
      o.ready_out  = d.cmd.done;
      o.op_succ    = d.cmd.done;
      break;
    }
    case State::Idle:
      break;
  }
  return o;
}

void Controller::finish(const OpResult& r) {
  result_ = r;
  last_op_cycles_ = op_cycles_;
  if (r.error) stats_.errors++;
  trace("ctrl: %s key=0x%08x done=%d hit=%d error=%d value=0x%016llx (%d cycles)\n",
        kvcam::opcode_name(req_.op), req_.key, (int)r.done, (int)r.hit, (int)r.error,
        (unsigned long long)r.value, last_op_cycles_);
}

void Controller::tick(const Inputs& in) {
  assert_always(slots_ != nullptr, "Controller: no SlotArray attached");
  if (!in.en) return; // clock gated: every register holds

  const bool   active    = state_ != State::Idle;
  const bool   aborting  = active && in.abort;
  const bool   requested = !active && in.start && in.op != Opcode::Noop;
  const bool   dispatch  = requested && !in.abort; // abort wins over a same-cycle start
  const State  target    = dispatch ? state_for(in.op) : State::Idle;
  if (active) { ++op_cycles_; ++stats_.busy_cycles; }
  if (requested && in.abort) {
    stats_.aborts++;
    result_ = OpResult{};
    trace("ctrl: abort %s key=0x%08x before dispatch\n", kvcam::opcode_name(in.op), in.key);
  }
  if (active && in.start) trace("ctrl: busy in %s, opcode %s ignored\n", ctrl_state_name(state_), kvcam::opcode_name(in.op));

  // ---- combinational ----
  const LookupResult look  = slots_->lookup(req_.key);
  const AllocResult  alloc = slots_->allocate_free();

  GetFsm::Inputs gi;
  gi.en    = state_ == State::Get || target == State::Get;
  gi.enter = target == State::Get || (aborting && state_ == State::Get);
  gi.hit   = look.hit;
  gi.value = look.value;

  UpsertFsm::Inputs ui;
  ui.en         = state_ == State::Put || target == State::Put;
  ui.enter      = target == State::Put || (aborting && state_ == State::Put);
  ui.hit        = look.hit;
  ui.idx_in     = look.idx;
  ui.free_found = alloc.found;
  ui.free_idx   = alloc.idx;

  DelFsm::Inputs di;
  di.en     = state_ == State::Del || target == State::Del;
  di.enter  = target == State::Del || (aborting && state_ == State::Del);
  di.hit    = look.hit;
  di.idx_in = look.idx;

  State next = state_;
  if (aborting) {
    // nothing staged this cycle: in-flight progress is dropped, committed slots stay
    stats_.aborts++;
    result_ = OpResult{};
    last_op_cycles_ = op_cycles_;
    trace("ctrl: abort %s key=0x%08x\n", kvcam::opcode_name(req_.op), req_.key);
    next = State::Idle;
  } else {
    switch (state_) {
      case State::Get: {
        const GetFsm::Outputs g = get_.outputs(gi);
        if (g.cmd.done) {
          OpResult r{};
          r.done  = true;
          r.hit   = g.hit;
          r.value = g.value;
          stats_.gets++;
          if (g.hit) stats_.get_hits++;
          finish(r);
          next = State::Idle;
        }
        break;
      }
      case State::Put: {
        const UpsertFsm::Outputs u = upsert_.outputs();
        if (u.write_out) slots_->write(u.idx_out, req_.key, req_.value);
        if (u.cmd.done) {
          OpResult r{};
          r.done  = true;
          r.hit   = u.existed;
          r.value = slots_->read_port(u.select_out, u.idx_out, req_.key).value;
          stats_.upserts++;
          if (u.existed) stats_.updates++; else stats_.inserts++;
          finish(r);
          next = State::Idle;
        } else if (u.cmd.error) {
          OpResult r{};
          r.error = true; // capacity exhausted, nothing written
          stats_.upserts++;
          finish(r);
          next = State::Idle;
        }
        break;
      }
      case State::Del: {
        const DelFsm::Outputs d = del_.outputs();
        if (d.delete_out) slots_->erase(d.idx_out);
        if (d.cmd.done || d.cmd.error) {
          OpResult r{};
          r.done  = d.cmd.done;
          r.hit   = d.cmd.done;
          r.error = d.cmd.error;
          stats_.deletes++;
          finish(r);
          next = State::Idle;
        }
        break;
      }
      case State::Idle:
        if (dispatch) {
          next = target;
        }
        break;
    }
  }

  // ---- clock edge ----
  get_.tick(gi);
  upsert_.tick(ui);
  del_.tick(di);
  if (dispatch) {
    req_.op    = in.op;
    req_.key   = in.key;
    req_.value = in.value;
    result_    = OpResult{};
    op_cycles_ = 0;
    trace("ctrl: IDLE -> %s key=0x%08x value=0x%016llx\n", ctrl_state_name(next), in.key,
          (unsigned long long)in.value);
  }
  state_ = next;
  slots_->tick();
}

void Controller::reset() {
  get_.reset();
  upsert_.reset();
  del_.reset();
  state_          = State::Idle;
  req_            = OpRequest{};
  result_         = OpResult{};
  stats_          = Stats{};
  op_cycles_      = 0;
  last_op_cycles_ = 0;
}

const char* ctrl_state_name(Controller::State s) {
  switch (s) {
    case Controller::State::Idle: return "IDLE";
    case Controller::State::Get:  return "GET";
    case Controller::State::Put:  return "PUT";
    case Controller::State::Del:  return "DEL";
  }
  return "?";
}
