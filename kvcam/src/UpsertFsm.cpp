// **********************************************************************
// kvcam/src/UpsertFsm.cpp
// **********************************************************************
// S Magierowski Jan 14 2026

#include "UpsertFsm.hpp"

using namespace Cascade;

UpsertFsm::UpsertFsm(std::string /*name*/, IMPL_CTOR) {}

UpsertFsm::Outputs UpsertFsm::outputs() const {
  Outputs o{};
  switch (state_) {
    case State::Update:
    case State::Insert:
      o.write_out = true;
      o.idx_out   = saved_idx_;
      break;
    case State::Done:
      o.cmd.done   = true;
      o.rdy_out    = true;
      o.op_succ    = true;
      o.select_out = true;       // read port by index, shows the committed slot
      o.idx_out    = saved_idx_;
      o.existed    = saved_hit_;
      break;
    case State::Full:
      o.cmd.error = true;
      break;
    case State::Start:
      break;
  }
  return o;
}

UpsertFsm::State UpsertFsm::next_state(const Inputs& in) const {
  if (!in.en)   return state_;
  if (in.enter) return State::Start;
  switch (state_) {
    case State::Start:
      if (in.hit)        return State::Update;
      if (in.free_found) return State::Insert;
      return State::Full;
    case State::Update:
    case State::Insert:
      return State::Done;
    case State::Done:
    case State::Full:
      return State::Start;
  }
  return State::Start;
}

void UpsertFsm::tick(const Inputs& in) {
  if (!in.en) return;
  const State next = next_state(in);
  if (in.enter || next == State::Start) {
    saved_idx_ = 0;
    saved_hit_ = false;
  } else if (state_ == State::Start) {
    saved_hit_ = in.hit;
    saved_idx_ = in.hit ? in.idx_in : (in.free_found ? in.free_idx : 0);
  }
  if (next != state_) {
    trace("upsert: %s -> %s idx=0x%llx\n", upsert_state_name(state_), upsert_state_name(next),
          (unsigned long long)saved_idx_);
  }
  state_ = next;
}

void UpsertFsm::reset() {
  state_     = State::Start;
  saved_idx_ = 0;
  saved_hit_ = false;
}

const char* upsert_state_name(UpsertFsm::State s) {
  switch (s) {
    case UpsertFsm::State::Start:  return "START";
    case UpsertFsm::State::Update: return "UPDATE";
    case UpsertFsm::State::Insert: return "INSERT";
    case UpsertFsm::State::Full:   return "FULL";
    case UpsertFsm::State::Done:   return "DONE";
  }
  return "?";
}
