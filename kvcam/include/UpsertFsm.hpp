// **********************************************************************
// kvcam/include/UpsertFsm.hpp
// **********************************************************************
// S Magierowski Jan 14 2026
/*
UPSERT sub-machine.

           +--hit------------> UPDATE --+
   START --+--miss, free-----> INSERT --+--> DONE --> START
           +--miss, full-----> FULL ---------------> START

 UPDATE/INSERT : write_out=1 for exactly one cycle, idx_out = target slot
 DONE          : done=1, rdy_out=op_succ=1, select_out=1 (read back idx_out)
 FULL          : error=1, op_succ=0, nothing written

The target comes from the match index (update in place, never a duplicate
key) or from the array's lowest free slot (insert).
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"

class UpsertFsm : public Component {
  DECLARE_COMPONENT(UpsertFsm);
public:
  UpsertFsm(std::string name, COMPONENT_CTOR);
  Clock(clk);

  enum class State : uint32_t { Start = 0u, Update = 1u, Insert = 2u, Full = 3u, Done = 4u };

  struct Inputs {
    bool     en         = false;
    bool     enter      = false;
    bool     hit        = false; // SlotArray::lookup
    SlotMask idx_in     = 0;
    bool     free_found = false; // SlotArray::allocate_free
    SlotMask free_idx   = 0;
  };

  struct Outputs {
    CmdStatus cmd{};
    SlotMask  idx_out    = 0;
    bool      write_out  = false;
    bool      select_out = false;
    bool      rdy_out    = false;
    bool      op_succ    = false;
    bool      existed    = false; // saved hit outcome, valid in DONE
  };

  Outputs outputs() const;
  State   next_state(const Inputs& in) const;
  void    tick(const Inputs& in);
  void    reset();

  State state() const { return state_; }

private:
  State    state_     = State::Start;
  SlotMask saved_idx_ = 0;
  bool     saved_hit_ = false;
};

const char* upsert_state_name(UpsertFsm::State s);
