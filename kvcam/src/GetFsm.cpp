// **********************************************************************
// kvcam/src/GetFsm.cpp
// **********************************************************************
// S Magierowski Jan 14 2026

#include "GetFsm.hpp"

using namespace Cascade;

GetFsm::GetFsm(std::string /*name*/, IMPL_CTOR) {}

GetFsm::Outputs GetFsm::outputs(const Inputs& in) const {
  Outputs o{};
  if (!in.en || in.enter) return o;
  o.cmd.done = true;
  o.hit      = in.hit;
  o.value    = in.hit ? in.value : 0;
  return o;
}

void GetFsm::tick(const Inputs& in) {
  if (!in.en) return;
  state_ = State::Start; // terminal in one cycle, enter or not
  if (!in.enter) {
    ++lookups_;
    trace("get: %s value=0x%016llx\n", in.hit ? "hit" : "miss",
          (unsigned long long)(in.hit ? in.value : 0));
  }
}

void GetFsm::reset() {
  state_   = State::Start;
  lookups_ = 0;
}
