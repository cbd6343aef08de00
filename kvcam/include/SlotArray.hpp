// **********************************************************************
// kvcam/include/SlotArray.hpp
// **********************************************************************
// S Magierowski Jan 12 2026
/*
Associative memory block: N fixed key/value slots plus the occupancy set.

            +--------------- SlotArray ----------------+
 key     -->| lookup()        (parallel compare) -> hit, idx, value
            | allocate_free() (lowest free slot) -> found, idx
 sel,idx -->| read_port()     (by key / by index)-> key, value
 idx,k,v -->| write()  \                               |
 idx     -->| erase()   > staged, committed on tick()  |
            +------------------------------------------+

Everything on the left is combinational against the current (pre-edge)
contents. write()/erase() issued in cycle T are visible from T+1.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"
#include <vector>

struct LookupResult {
  bool      hit   = false;
  SlotMask  idx   = 0;     // one-hot, 0 on miss
  ValueWord value = 0;     // 0 on miss
};

struct AllocResult {
  bool     found = false;
  SlotMask idx   = 0;      // one-hot lowest free slot, 0 when full
};

struct SlotView {
  KeyWord   key   = 0;
  ValueWord value = 0;
};

class SlotArray : public Component {
  DECLARE_COMPONENT(SlotArray);
public:
  SlotArray(std::string name, int num_slots, COMPONENT_CTOR);
  Clock(clk);

  // Combinational side
  LookupResult lookup(KeyWord key) const;
  AllocResult  allocate_free() const;
  SlotView     read_port(bool select, SlotMask idx, KeyWord key) const; // select=1: by index, 0: by key

  // Mutations, at most one per cycle
  void write(SlotMask idx, KeyWord key, ValueWord value); // insert or update; sets occupied
  void erase(SlotMask idx);                               // clears occupied, zeroes the slot

  void tick();   // clock edge: commit the staged mutation
  void reset();

  SlotMask used_entries() const { return used_; }
  int      used_count()   const { return kvcam::popcount(used_); }
  int      num_slots()    const { return static_cast<int>(slots_.size()); }
  bool     occupied(int i) const { return (used_ >> i) & 1u; }
  SlotView slot(int i)     const { return SlotView{slots_[i].key, slots_[i].value}; }
  bool     commit_pending() const { return pending_ != Pending::None; }

  void dump() const; // table of occupied slots on std::cout

private:
  struct Slot {
    KeyWord   key   = 0;
    ValueWord value = 0;
  };
  enum class Pending { None, Write, Erase };

  int check_index(SlotMask idx, const char* who) const;

  std::vector<Slot> slots_;
  SlotMask used_ = 0;       // occupancy set, bit i = slot i live

  Pending   pending_     = Pending::None;
  int       pend_slot_   = 0;
  KeyWord   pend_key_    = 0;
  ValueWord pend_value_  = 0;
};
