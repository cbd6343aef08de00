// **********************************************************************
// kvcam/src/Invariants.cpp
// **********************************************************************
// S Magierowski Jan 19 2026

#include "Invariants.hpp"

#include <iostream>

using namespace Cascade;

namespace kvcam {

bool keys_unique(const SlotArray& slots) {
  for (int i = 0; i < slots.num_slots(); ++i) {
    if (!slots.occupied(i)) continue;
    for (int j = i + 1; j < slots.num_slots(); ++j) {
      if (slots.occupied(j) && slots.slot(j).key == slots.slot(i).key) return false;
    }
  }
  return true;
}

bool free_slots_clear(const SlotArray& slots) {
  for (int i = 0; i < slots.num_slots(); ++i) {
    if (slots.occupied(i)) continue;
    const SlotView v = slots.slot(i);
    if (v.key != 0 || v.value != 0) return false;
  }
  return true;
}

void verify_and_report_postmortem(const SlotArray& slots,
                                  const Controller& ctrl,
                                  int expected_live,
                                  int cycle) {
  const Controller::Stats& s = ctrl.stats();
  std::cout << "---- post-mortem @ cycle " << cycle << " ----" << std::endl;
  std::cout << "controller: " << ctrl_state_name(ctrl.state())
            << "  gets=" << s.gets << " (hits " << s.get_hits << ")"
            << "  upserts=" << s.upserts << " (ins " << s.inserts << ", upd " << s.updates << ")"
            << "  deletes=" << s.deletes
            << "  errors=" << s.errors
            << "  aborts=" << s.aborts
            << "  busy_cycles=" << s.busy_cycles << std::endl;
  slots.dump();

  assert_always(keys_unique(slots), "post-mortem: duplicate key among occupied slots");
  assert_always(free_slots_clear(slots), "post-mortem: free slot holds stale data");
  if (expected_live >= 0) {
    assert_always(slots.used_count() == expected_live, "post-mortem: occupancy does not match inserts - deletes");
  }
}

} // namespace kvcam
