// **********************************************************************
// kvsoc/src/KvSoc.cpp
// **********************************************************************
// S Magierowski Jan 23 2026

#include "KvSoc.hpp"

using namespace Cascade;

KvSoc::KvSoc(const KvConfig& cfg, IMPL_CTOR)
{
  assert_always(cfg.num_slots >= 1 && cfg.num_slots <= KvConfig::kMaxSlots, "KvSoc: -slots must be 1..64");

  // ---- Allocate blocks ----
  master_ = new ObiMaster("master");
  cache_  = new KvCache("cache", cfg);

  // ---- Clocking ----
  master_->clk << clk; cache_->clk << clk;

  // ---- Master <-> cache ----
  cache_->obi_req  << master_->m_req;
  master_->m_resp  << cache_->obi_resp;
  // 0/0 delays end-to-end; the cache owns timing
  cache_->obi_req.setDelay(0);
  cache_->obi_resp.setDelay(0);
}

void KvSoc::reset() {
  // children reset themselves
}

KvSoc::~KvSoc() {
  delete cache_;
  delete master_;
}
