// **********************************************************************
// kvsoc/src/KvCache.cpp
// **********************************************************************
// S Magierowski Jan 22 2026

#include "KvCache.hpp"

using namespace Cascade;

KvCache::KvCache(std::string /*name*/, const KvConfig& cfg, IMPL_CTOR)
  : cfg_(cfg), slots_("slots", cfg.num_slots), ctrl_("ctrl")
{
  UPDATE(update).reads(obi_req).writes(obi_resp); // same-cycle response to the master
  assert_always(cfg_.poll_budget > 0, "KvCache: poll_budget must be positive");
  slots_.clk << clk;
  ctrl_.clk << clk;
  ctrl_.attach_slots(&slots_);
}

void KvCache::set_busy_policy(BusyWritePolicy p) {
  cfg_.busy_writes = p;
  trace("kvcache: busy_writes=%s\n", kvcam::busy_policy_name(p));
}

uint32_t KvCache::status_word() const {
  const OpResult& r = ctrl_.result();
  return kvregs::encode_status(r.done, r.hit, r.error, static_cast<uint32_t>(ctrl_.state()));
}

uint32_t KvCache::peek(uint32_t offset) const {
  switch (offset) {
    case kvregs::VALUE_LO:  return static_cast<uint32_t>(value_reg_);
    case kvregs::VALUE_HI:  return static_cast<uint32_t>(value_reg_ >> 32);
    case kvregs::KEY:       return key_reg_;
    case kvregs::OPERATION: return op_reg_;
    case kvregs::STATUS:    return status_word();
    case kvregs::RESULT_LO: return static_cast<uint32_t>(ctrl_.result().value);
    case kvregs::RESULT_HI: return static_cast<uint32_t>(ctrl_.result().value >> 32);
    default:                return 0;
  }
}

ObiResp KvCache::bus_read(uint32_t offset) {
  ObiResp resp{};
  bus_stats_.reads++;
  if (!kvregs::is_mapped(offset)) {
    bus_stats_.unmapped++;
    trace("kvcache: R 0x%02x unmapped\n", offset);
    return resp; // rdata=0 err=0
  }
  resp.rdata = peek(offset);
  trace("kvcache: R %s = 0x%08x\n", kvregs::reg_name(offset), (uint32_t)resp.rdata);
  return resp;
}

ObiResp KvCache::bus_write(uint32_t offset, uint32_t data, uint32_t be) {
  ObiResp resp{};
  bus_stats_.writes++;
  if (!kvregs::is_mapped(offset)) {
    bus_stats_.unmapped++;
    trace("kvcache: W 0x%02x unmapped, ignored\n", offset);
    return resp;
  }
  if (!kvregs::is_writable(offset)) {
    trace("kvcache: W %s read-only, ignored\n", kvregs::reg_name(offset));
    return resp;
  }
  if (busy() && cfg_.busy_writes == BusyWritePolicy::Reject) {
    bus_stats_.rejected++;
    resp.err = true;
    trace("kvcache: W %s rejected, controller busy\n", kvregs::reg_name(offset));
    return resp;
  }

  switch (offset) {
    case kvregs::VALUE_LO: {
      const uint32_t lo = kvregs::merge_bytes(static_cast<uint32_t>(value_reg_), data, be);
      value_reg_ = (value_reg_ & 0xFFFFFFFF00000000ull) | lo;
      break;
    }
    case kvregs::VALUE_HI: {
      const uint32_t hi = kvregs::merge_bytes(static_cast<uint32_t>(value_reg_ >> 32), data, be);
      value_reg_ = (value_reg_ & 0x00000000FFFFFFFFull) | (static_cast<ValueWord>(hi) << 32);
      break;
    }
    case kvregs::KEY:
      key_reg_ = kvregs::merge_bytes(key_reg_, data, be);
      break;
    case kvregs::OPERATION: {
      op_reg_ = kvregs::merge_bytes(op_reg_, data, be) & 0x3u;
      const Opcode op = kvcam::decode_opcode(op_reg_);
      if (op != Opcode::Noop && !busy()) {
        op_start_ = true;
      } else if (op != Opcode::Noop) {
        trace("kvcache: %s while busy, not started\n", kvcam::opcode_name(op));
      }
      break;
    }
  }
  trace("kvcache: W %s = 0x%08x be=0x%x\n", kvregs::reg_name(offset), data, be);
  return resp;
}

void KvCache::update() {
  cyc_++;

  if (rst_) {
    clear_state();
    if (!obi_req.empty() && !obi_resp.full()) { // held in reset: accept and drop
      auto rq = obi_req.pop();
      ObiResp resp{};
      resp.rid = rq.aid;
      resp.gnt = true;
      obi_resp.push(resp);
    }
    return;
  }

  // ---- engine ----
  Controller::Inputs in;
  in.en    = enable_;
  in.start = op_start_;
  in.op    = kvcam::decode_opcode(op_reg_);
  in.key   = key_reg_;
  in.value = value_reg_;
  in.abort = abort_;
  ctrl_.tick(in);
  if (enable_) {
    op_start_ = false;
    abort_    = false;
  }

  // ---- bus ----
  if (!obi_req.empty() && !obi_resp.full()) {
    auto rq = obi_req.pop();
    const uint32_t offset = (uint32_t)rq.addr;
    ObiResp resp = (bool)rq.we ? bus_write(offset, (uint32_t)rq.wdata, (uint32_t)rq.be)
                         : bus_read(offset);
    resp.rid = rq.aid;
    resp.gnt = true;
    obi_resp.push(resp);
  }
}

void KvCache::clear_state() {
  slots_.reset();
  ctrl_.reset();
  value_reg_ = 0;
  key_reg_   = 0;
  op_reg_    = 0;
  op_start_  = false;
  abort_     = false;
}

void KvCache::reset() {
  clear_state();
  rst_       = false;
  enable_    = true;
  cyc_       = 0;
  bus_stats_ = BusStats{};
}
