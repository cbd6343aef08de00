// **********************************************************************
// kvsoc/src/ObiMaster.cpp
// **********************************************************************
// S Magierowski Jan 22 2026

#include "ObiMaster.hpp"

using namespace Cascade;

namespace {
constexpr size_t kCommandEvents = 7; // 4 writes, poll, 2 result reads
}

ObiMaster::ObiMaster(std::string /*name*/, IMPL_CTOR) {
  UPDATE(update_issue).writes(m_req);
  UPDATE(update_retire).reads(m_resp);
}

void ObiMaster::clear_script() { script_.clear(); pc_ = 0; polls_ = 0; }
void ObiMaster::clear_results() { results_.clear(); pending_.clear(); }

void ObiMaster::enqueue_write(uint32_t addr, uint32_t data, uint8_t be) {
  script_.push_back(Op{WRITE, addr, data, be, 0});
}
void ObiMaster::enqueue_read(uint32_t addr) {
  script_.push_back(Op{READ, addr, 0u, 0xF, 0});
}
void ObiMaster::enqueue_poll_idle(int budget) {
  assert_always(budget > 0, "ObiMaster: poll budget must be positive");
  script_.push_back(Op{POLL, kvregs::STATUS, 0u, 0xF, budget});
}

void ObiMaster::enqueue_command(Opcode op, KeyWord key, ValueWord value, int budget) {
  enqueue_write(kvregs::VALUE_LO, static_cast<uint32_t>(value));
  enqueue_write(kvregs::VALUE_HI, static_cast<uint32_t>(value >> 32));
  enqueue_write(kvregs::KEY, key);
  enqueue_write(kvregs::OPERATION, static_cast<uint32_t>(op));
  enqueue_poll_idle(budget);
  enqueue_read(kvregs::RESULT_LO);
  enqueue_read(kvregs::RESULT_HI);
}

void ObiMaster::update_issue() {
  cyc_++;

  // single outstanding: wait for the previous response
  if (pc_ >= script_.size() || !pending_.empty() || m_req.full()) return;

  const Op &op = script_[pc_];
  ObiReq r{};
  r.addr = (u32)op.addr;
  r.be   = (u8)op.be;
  r.aid  = (u16)next_id_++;
  if (op.kind == WRITE) {
    r.we    = true;
    r.wdata = (u32)op.data;
  }
  uint64_t sent = cyc_;
  if (op.kind == POLL) {
    if (polls_ == 0) poll_sent_ = cyc_;
    sent = poll_sent_;
    polls_++;
  } else {
    pc_++;
  }
  pending_[(uint16_t)r.aid] = Pending{op.kind, op.addr, sent};
  m_req.push(r);
}

void ObiMaster::update_retire() {
  if (m_resp.empty()) return;
  auto rr = m_resp.pop();
  auto it = pending_.find((uint16_t)rr.rid);
  assert_always(it != pending_.end(), "ObiMaster: response matches no outstanding request");

  Ev e{};
  e.id       = (uint16_t)rr.rid;
  e.kind     = it->second.kind;
  e.addr     = it->second.addr;
  e.sent_cyc = it->second.sent_cyc;
  e.resp_cyc = cyc_;
  e.rdata    = (uint32_t)rr.rdata;
  e.err      = (bool)rr.err;
  e.timeout  = false;
  e.polls    = 0;
  pending_.erase(it);

  if (e.kind != POLL) {
    results_.push_back(e);
    return;
  }

  const kvregs::StatusBits st = kvregs::decode_status(e.rdata);
  const Op &op = script_[pc_];
  if (st.state == 0 || polls_ >= op.budget) {
    e.polls   = polls_;
    e.timeout = st.state != 0;
    if (e.timeout) trace("master: poll timeout after %d reads, STATUS=0x%02x\n", polls_, e.rdata);
    results_.push_back(e);
    polls_ = 0;
    pc_++;
  }
}

void ObiMaster::reset() {
  cyc_ = 0;
  pc_ = 0;
  polls_ = 0;
  poll_sent_ = 0;
  next_id_ = 0;
  script_.clear();
  results_.clear();
  pending_.clear();
}

BusOutcome last_command_outcome(const ObiMaster& master) {
  BusOutcome out;
  const auto& rs = master.results();
  if (rs.size() < kCommandEvents) return out;
  const size_t base = rs.size() - kCommandEvents;
  for (size_t i = base; i < rs.size(); ++i) out.bus_err = out.bus_err || rs[i].err;
  const ObiMaster::Ev& poll = rs[base + 4];
  const ObiMaster::Ev& lo   = rs[base + 5];
  const ObiMaster::Ev& hi   = rs[base + 6];
  if (poll.kind != ObiMaster::POLL || lo.addr != kvregs::RESULT_LO || hi.addr != kvregs::RESULT_HI) return out;
  out.status = kvregs::decode_status(poll.rdata);
  out.result = (static_cast<ValueWord>(hi.rdata) << 32) | lo.rdata;
  out.polls  = poll.polls;
  out.cycles = hi.resp_cyc - rs[base].sent_cyc;
  out.ok     = !poll.timeout;
  return out;
}
