// **********************************************************************
// kvsoc/include/KvCache.hpp
// **********************************************************************
// S Magierowski Jan 22 2026
/*
Bus-attached key/value cache: register bank + Controller + SlotArray.

        +---------------------------- KvCache ------------------------------+
 ==>    | obi_req   decode --> VALUE/KEY/OPERATION regs --op_start_-->        |
        |                                                Controller --> SlotArray
 <==    | obi_resp  <-- STATUS / RESULT (latched result + controller state)  |
        +-------------------------------------------------------------------+

One update() is one clock:
  1. engine: Controller ticks with last cycle's OPERATION strobe and the
     current VALUE/KEY registers (captured by the controller at dispatch)
  2. bus: at most one request popped and answered in the same cycle
     (gnt and rvalid together, writes included)
So a write to OPERATION in cycle T starts the operation at T+1, and a
STATUS read in T+1 already sees the controller out of IDLE.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "ObiTypes.hpp"
#include "KvRegs.hpp"
#include "KvTypes.hpp"
#include "SlotArray.hpp"
#include "Controller.hpp"

class KvCache : public Component {
  DECLARE_COMPONENT(KvCache);
public:
  KvCache(std::string name, const KvConfig& cfg, COMPONENT_CTOR);

  Clock(clk);
  FifoInput (ObiReq,  obi_req);
  FifoOutput(ObiResp, obi_resp);

  struct BusStats {
    uint64_t reads    = 0;
    uint64_t writes   = 0;
    uint64_t rejected = 0; // busy writes answered err=1
    uint64_t unmapped = 0;
  };

  void update();
  void reset();

  // TB hooks
  void set_rst(bool v)    { rst_ = v; }      // synchronous reset, sampled every cycle
  void set_enable(bool v) { enable_ = v; }   // engine clock enable
  void request_abort()    { abort_ = true; } // cancel the in-flight operation next cycle
  void set_busy_policy(BusyWritePolicy p);

  const KvConfig&   config() const { return cfg_; }
  const SlotArray&  slots()  const { return slots_; }
  const Controller& ctrl()   const { return ctrl_; }
  const BusStats&   bus_stats() const { return bus_stats_; }
  uint64_t          cycle()  const { return cyc_; }

  uint32_t  status_word() const;
  uint32_t  peek(uint32_t offset) const; // register read without a bus transaction
  ValueWord value_reg() const { return value_reg_; }
  KeyWord   key_reg()   const { return key_reg_; }
  uint32_t  op_reg()    const { return op_reg_; }

private:
  bool busy() const { return !ctrl_.idle() || op_start_; }
  ObiResp  bus_read(uint32_t offset);
  ObiResp  bus_write(uint32_t offset, uint32_t data, uint32_t be);
  void     clear_state();

  KvConfig   cfg_;
  SlotArray  slots_;
  Controller ctrl_;

  // register bank
  ValueWord value_reg_ = 0;
  KeyWord   key_reg_   = 0;
  uint32_t  op_reg_    = 0;
  bool      op_start_  = false; // registered OPERATION strobe

  bool     rst_    = false;
  bool     enable_ = true;
  bool     abort_  = false;
  uint64_t cyc_    = 0;
  BusStats bus_stats_{};
};
