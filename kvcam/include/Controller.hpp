// **********************************************************************
// kvcam/include/Controller.hpp
// **********************************************************************
// S Magierowski Jan 15 2026
/*
Dispatch controller: decodes the opcode, runs exactly one sub-machine and
forwards its write/delete strobes to the slot array.

            start,op,key,value
                   |
   +---------------v-------------- Controller ---------------------------+
   |  IDLE --GET----> GET ----done------------------------------> IDLE   |
   |       --UPSERT-> PUT ----done|error------------------------> IDLE   |
   |       --DELETE-> DEL ----done|error------------------------> IDLE   |
   |                                                                     |
   |   GetFsm  UpsertFsm  DelFsm   (only the active one is enabled)      |
   +------------------------------+--------------------------------------+
                                  | lookup / allocate_free / write / erase
                             SlotArray

A new opcode is honoured only in IDLE; the operands are captured at that
edge so bus writes during the run land in the registers for the next op.
abort forces the active sub-machine back to START (its "enter" line) and the
controller back to IDLE; writes already committed stay committed.
An abort in the cycle of a start cancels that start: nothing is dispatched.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"
#include "SlotArray.hpp"
#include "GetFsm.hpp"
#include "UpsertFsm.hpp"
#include "DelFsm.hpp"

class Controller : public Component {
  DECLARE_COMPONENT(Controller);
public:
  Controller(std::string name, COMPONENT_CTOR);
  Clock(clk);

  enum class State : uint32_t { Idle = 0u, Get = 1u, Put = 2u, Del = 3u }; // STATUS bits [4:3]

  struct Inputs {
    bool      en    = true;
    bool      start = false;  // opcode strobe from the bus side
    Opcode    op    = Opcode::Noop;
    KeyWord   key   = 0;
    ValueWord value = 0;
    bool      abort = false;
  };

  // signals driven from the active sub-machine, zero in IDLE
  struct Outputs {
    State    state      = State::Idle;
    SlotMask idx_out    = 0;
    bool     write_out  = false;
    bool     delete_out = false;
    bool     select_out = false;
    bool     ready_out  = false;
    bool     op_succ    = false;
  };

  struct Stats {
    uint64_t gets     = 0;
    uint64_t get_hits = 0;
    uint64_t upserts  = 0;
    uint64_t inserts  = 0;
    uint64_t updates  = 0;
    uint64_t deletes  = 0;
    uint64_t errors   = 0;
    uint64_t aborts   = 0;
    uint64_t busy_cycles = 0;
  };

  void attach_slots(SlotArray* slots) { slots_ = slots; }

  Outputs outputs() const;
  void    tick(const Inputs& in); // one clock: evaluate, stage, edge, commit
  void    reset();

  State            state()          const { return state_; }
  bool             idle()           const { return state_ == State::Idle; }
  const OpResult&  result()         const { return result_; }
  const OpRequest& request()        const { return req_; }
  const Stats&     stats()          const { return stats_; }
  int              last_op_cycles() const { return last_op_cycles_; }

  // sub-machines, exposed read-only for observation
  const GetFsm&    get_fsm()    const { return get_; }
  const UpsertFsm& upsert_fsm() const { return upsert_; }
  const DelFsm&    del_fsm()    const { return del_; }

private:
  static State state_for(Opcode op);
  void finish(const OpResult& r);

  SlotArray* slots_ = nullptr;
  GetFsm     get_;
  UpsertFsm  upsert_;
  DelFsm     del_;

  State     state_ = State::Idle;
  OpRequest req_{};      // operand snapshot owned for the duration of the op
  OpResult  result_{};   // latched at completion
  Stats     stats_{};
  int       op_cycles_      = 0;
  int       last_op_cycles_ = 0;
};

const char* ctrl_state_name(Controller::State s);
