// **********************************************************************
// kvcam/src/SlotArray.cpp
// **********************************************************************
// S Magierowski Jan 12 2026
/*
The "parallel" compare is a linear scan over the arena; the priority
encoder behaviour (lowest index wins) is explicit, not an accident of
iteration order, because allocate_free() must pick the lowest free slot
for reproducible results.
*/
#include "SlotArray.hpp"

#include <iomanip>
#include <iostream>

using namespace Cascade;

SlotArray::SlotArray(std::string /*name*/, int num_slots, IMPL_CTOR) {
  assert_always(num_slots >= 1 && num_slots <= KvConfig::kMaxSlots,
                "SlotArray: num_slots must be 1..64");
  slots_.resize(static_cast<size_t>(num_slots));
}

LookupResult SlotArray::lookup(KeyWord key) const {
  LookupResult r{};
  for (int i = 0; i < num_slots(); ++i) {
    if (occupied(i) && slots_[i].key == key) { // comparator: occupied==1 AND key==input
      r.hit   = true;
      r.idx   = kvcam::index_to_onehot(i);
      r.value = slots_[i].value;
      break;
    }
  }
  return r;
}

AllocResult SlotArray::allocate_free() const {
  AllocResult r{};
  const SlotMask free = ~used_ & kvcam::full_mask(num_slots());
  if (free == 0) return r;     // capacity exhausted
  r.found = true;
  r.idx   = free & (~free + 1); // isolate lowest set bit
  return r;
}

SlotView SlotArray::read_port(bool select, SlotMask idx, KeyWord key) const {
  if (select) {
    if (!kvcam::is_onehot(idx) || (idx & ~kvcam::full_mask(num_slots())) != 0) return SlotView{};
    return slot(kvcam::onehot_to_index(idx));
  }
  const LookupResult r = lookup(key);
  if (!r.hit) return SlotView{};
  return SlotView{key, r.value};
}

int SlotArray::check_index(SlotMask idx, const char* who) const {
  assert_always(kvcam::is_onehot(idx), who);
  assert_always((idx & ~kvcam::full_mask(num_slots())) == 0, who);
  assert_always(pending_ == Pending::None, "SlotArray: two mutations staged in one cycle");
  return kvcam::onehot_to_index(idx);
}

void SlotArray::write(SlotMask idx, KeyWord key, ValueWord value) {
  pend_slot_  = check_index(idx, "SlotArray::write: index must be one-hot and in range");
  pend_key_   = key;
  pend_value_ = value;
  pending_    = Pending::Write;
}

void SlotArray::erase(SlotMask idx) {
  pend_slot_ = check_index(idx, "SlotArray::erase: index must be one-hot and in range");
  pending_   = Pending::Erase;
}

void SlotArray::tick() {
  switch (pending_) {
    case Pending::Write:
      slots_[pend_slot_].key   = pend_key_;
      slots_[pend_slot_].value = pend_value_;
      used_ |= kvcam::index_to_onehot(pend_slot_); // key, value and occupied commit together
      trace("slots: write [%d] key=0x%08x value=0x%016llx used=%d\n",
            pend_slot_, pend_key_, (unsigned long long)pend_value_, used_count());
      break;
    case Pending::Erase:
      slots_[pend_slot_] = Slot{};
      used_ &= ~kvcam::index_to_onehot(pend_slot_);
      trace("slots: erase [%d] used=%d\n", pend_slot_, used_count());
      break;
    case Pending::None:
      break;
  }
  pending_ = Pending::None;
}

void SlotArray::reset() {
  for (auto& s : slots_) s = Slot{};
  used_    = 0;
  pending_ = Pending::None;
}

void SlotArray::dump() const {
  std::ios_base::fmtflags old_flags = std::cout.flags();
  char old_fill = std::cout.fill('0');

  std::cout << "slots used " << std::dec << used_count() << "/" << num_slots()
            << " (used=0x" << std::hex << std::setw(16) << used_ << ")" << std::endl;
  for (int i = 0; i < num_slots(); ++i) {
    if (!occupied(i)) continue;
    std::cout << "  [" << std::dec << std::setw(2) << i << "] key=0x"
              << std::hex << std::setw(8) << slots_[i].key
              << " value=0x" << std::setw(16) << slots_[i].value
              << std::endl;
  }

  std::cout.fill(old_fill);
  std::cout.flags(old_flags);
}
