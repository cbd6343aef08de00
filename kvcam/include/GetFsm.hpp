// **********************************************************************
// kvcam/include/GetFsm.hpp
// **********************************************************************
// S Magierowski Jan 14 2026
/*
GET sub-machine: a single START state. While enabled it reports done=1
and forwards hit/value straight from the lookup; a miss is a valid result
(hit=0, value=0), never an error. Touches no storage.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"

class GetFsm : public Component {
  DECLARE_COMPONENT(GetFsm);
public:
  GetFsm(std::string name, COMPONENT_CTOR);
  Clock(clk);

  enum class State : uint32_t { Start = 0u };

  struct Inputs {
    bool      en    = false;
    bool      enter = false;
    bool      hit   = false;
    ValueWord value = 0;
  };

  struct Outputs {
    CmdStatus cmd{};
    bool      hit   = false;
    ValueWord value = 0;
  };

  Outputs outputs(const Inputs& in) const; // pass-through of the lookup
  void    tick(const Inputs& in);
  void    reset();

  State    state()   const { return state_; }
  uint64_t lookups() const { return lookups_; }

private:
  State    state_   = State::Start;
  uint64_t lookups_ = 0;
};
