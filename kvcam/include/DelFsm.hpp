// **********************************************************************
// kvcam/include/DelFsm.hpp
// **********************************************************************
// S Magierowski Jan 14 2026
/*
DELETE sub-machine.

   START --hit--> DELETE --> START      DELETE: delete_out=1, idx_out=idx, done=1
     |                                   ERROR : error=1
     +---miss--> ERROR  --> START       START : all outputs idle

en=0 freezes state and outputs. enter=1 forces START and drops the saved
index (cancellation). idx_out/delete_out are live only in DELETE.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"

class DelFsm : public Component {
  DECLARE_COMPONENT(DelFsm);
public:
  DelFsm(std::string name, COMPONENT_CTOR);
  Clock(clk);

  enum class State : uint32_t { Start = 0u, Delete = 1u, Error = 2u };

  struct Inputs {
    bool     en     = false;
    bool     enter  = false;
    bool     hit    = false; // from SlotArray::lookup
    SlotMask idx_in = 0;     // one-hot match
  };

  struct Outputs {
    CmdStatus cmd{};
    SlotMask  idx_out    = 0;
    bool      delete_out = false;
  };

  Outputs outputs() const;        // Moore: function of state only
  State   next_state(const Inputs& in) const;
  void    tick(const Inputs& in); // clock edge
  void    reset();

  State state() const { return state_; }

private:
  State    state_     = State::Start;
  SlotMask saved_idx_ = 0;
};

const char* del_state_name(DelFsm::State s);
