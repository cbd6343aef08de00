// **********************************************************************
// kvsoc/include/KvSoc.hpp
// **********************************************************************
// S Magierowski Jan 23 2026
/*
------ ObiMaster -------+   +-------------- KvCache -----------------------+
 update_issue() -> m_req |==>| obi_req   update(): engine tick, then one    |
                         |   |           bus transaction                    |
update_retire() <- m_resp|<==| obi_resp  Controller + SlotArray             |
-------------------------+   +----------------------------------------------+
Both FIFOs run at zero delay: a request is granted and answered in the
cycle it is issued.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include "KvTypes.hpp"
#include "ObiMaster.hpp"
#include "KvCache.hpp"
#include <string>

using namespace Cascade; // ok in project headers (macros expect it), but avoid in sub-component headers

class KvSoc : public Component {
  DECLARE_COMPONENT(KvSoc);

public:
  KvSoc(const KvConfig& cfg, COMPONENT_CTOR);
  ~KvSoc() override;

  Clock(clk);

  void reset();

  // TB hooks
  void set_rst(bool v)                    { if (cache_) cache_->set_rst(v); }
  void set_busy_policy(BusyWritePolicy p) { if (cache_) cache_->set_busy_policy(p); }
  const KvConfig& config() const          { return cache_->config(); }

  // Submodules (owned by KvSoc)
  ObiMaster *master_ = nullptr;
  KvCache   *cache_  = nullptr;
};
