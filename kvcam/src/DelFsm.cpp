// **********************************************************************
// kvcam/src/DelFsm.cpp
// **********************************************************************
// S Magierowski Jan 14 2026

#include "DelFsm.hpp"

using namespace Cascade;

DelFsm::DelFsm(std::string /*name*/, IMPL_CTOR) {}

DelFsm::Outputs DelFsm::outputs() const {
  Outputs o{};
  switch (state_) {
    case State::Delete:
      o.cmd.done   = true;
      o.idx_out    = saved_idx_;
      o.delete_out = true;
      break;
    case State::Error:
      o.cmd.error  = true;
      break;
    case State::Start:
      break;
  }
  return o;
}

DelFsm::State DelFsm::next_state(const Inputs& in) const {
  if (!in.en)   return state_;
  if (in.enter) return State::Start;
  switch (state_) {
    case State::Start:  return in.hit ? State::Delete : State::Error;
    case State::Delete: return State::Start;
    case State::Error:  return State::Start;
  }
  return State::Start;
}

void DelFsm::tick(const Inputs& in) {
  if (!in.en) return; // frozen, outputs held
  const State next = next_state(in);
  if (in.enter) {
    saved_idx_ = 0;
  } else if (state_ == State::Start && next == State::Delete) {
    saved_idx_ = in.idx_in;
  } else if (next == State::Start) {
    saved_idx_ = 0;
  }
  if (next != state_) {
    trace("del: %s -> %s idx=0x%llx\n", del_state_name(state_), del_state_name(next),
          (unsigned long long)saved_idx_);
  }
  state_ = next;
}

void DelFsm::reset() {
  state_     = State::Start;
  saved_idx_ = 0;
}

const char* del_state_name(DelFsm::State s) {
  switch (s) {
    case DelFsm::State::Start:  return "START";
    case DelFsm::State::Delete: return "DELETE";
    case DelFsm::State::Error:  return "ERROR";
  }
  return "?";
}
