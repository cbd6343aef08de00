// **********************************************************************
// kvsoc/include/ObiMaster.hpp
// **********************************************************************
// S Magierowski Jan 22 2026
/*
Scripted register-bus master. The host enqueues reads, writes and STATUS
polls; update_issue() sends at most one request per cycle (single
outstanding), update_retire() stamps each response with the cycle it
arrived and records it in results().

A POLL re-reads STATUS every cycle until the controller-state field reads
IDLE or the budget runs out; it occupies the script until then.
*/
#pragma once
#include <cascade/Cascade.hpp>
#include "ObiTypes.hpp"
#include "KvRegs.hpp"
#include "KvTypes.hpp"
#include <vector>
#include <unordered_map>

class ObiMaster : public Component {
  DECLARE_COMPONENT(ObiMaster);
public:
  ObiMaster(std::string name, COMPONENT_CTOR);

  Clock(clk);

  FifoOutput(ObiReq,  m_req);
  FifoInput (ObiResp, m_resp);

  // Scripted ops
  enum Kind : uint8_t { READ=0, WRITE=1, POLL=2 };
  struct Op { Kind kind; uint32_t addr; uint32_t data; uint8_t be; int budget; };

  // Result record (one per completed op)
  struct Ev {
    uint16_t id;
    Kind     kind;
    uint32_t addr;
    uint64_t sent_cyc;  // first request of the op
    uint64_t resp_cyc;
    uint32_t rdata;     // last word read (STATUS for a POLL)
    bool     err;
    bool     timeout;   // POLL only
    int      polls;     // POLL only
  };

  // Host helpers to build scripts and inspect results
  void clear_script();
  void clear_results();
  void enqueue_write(uint32_t addr, uint32_t data, uint8_t be=0xF);
  void enqueue_read(uint32_t addr);
  void enqueue_poll_idle(int budget);
  // VALUE_LO, VALUE_HI, KEY, OPERATION writes followed by a STATUS poll and a RESULT read
  void enqueue_command(Opcode op, KeyWord key, ValueWord value, int budget);

  bool idle() const { return pc_ >= script_.size() && pending_.empty(); }
  const std::vector<Ev>& results() const { return results_; }
  uint64_t cycle() const { return cyc_; }

  void update_issue();   // reads internal state, writes m_req
  void update_retire();  // reads m_resp, writes internal state
  void reset();

private:
  uint64_t cyc_ = 0;

  std::vector<Op> script_;
  size_t pc_ = 0;

  uint16_t next_id_ = 0;
  struct Pending { Kind kind; uint32_t addr; uint64_t sent_cyc; };
  std::unordered_map<uint16_t, Pending> pending_;

  // POLL progress for script_[pc_]
  int      polls_     = 0;
  uint64_t poll_sent_ = 0;

  std::vector<Ev> results_;
};

// One command as seen from the bus, rebuilt from a results() tail
struct BusOutcome {
  bool              ok      = false; // all transactions answered, poll reached IDLE
  kvregs::StatusBits status{};
  ValueWord         result  = 0;
  int               polls   = 0;
  uint64_t          cycles  = 0;     // first write to final RESULT read
  bool              bus_err = false; // any err=1 on the way
};

// Decode the last enqueue_command() from the master's result log
BusOutcome last_command_outcome(const ObiMaster& master);
