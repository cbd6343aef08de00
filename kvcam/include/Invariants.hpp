// **********************************************************************
// kvcam/include/Invariants.hpp
// **********************************************************************
// S Magierowski Jan 19 2026
/*
Post-mortem checks over the slot array, usable from any testbench once a
run stops: key uniqueness among live slots, cleared free slots, and a
printed summary of controller statistics.
*/
#pragma once
#include "SlotArray.hpp"
#include "Controller.hpp"

namespace kvcam {

bool keys_unique(const SlotArray& slots);       // no two occupied slots share a key
bool free_slots_clear(const SlotArray& slots);  // unoccupied slots read back key=0 value=0

// expected_live = inserts - successful deletes as counted by the caller (<0: skip)
void verify_and_report_postmortem(const SlotArray& slots,
                                  const Controller& ctrl,
                                  int expected_live,
                                  int cycle);
} // namespace kvcam
