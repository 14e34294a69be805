#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace alo::delivery {
class DeliveryQueue;
}

namespace alo::scheduler {

struct SweepReport {
  uint64_t promoted  = 0;
  uint64_t race_lost = 0;
};

/*
  Promotes due campaigns (scheduled, send_at <= now) to queued.

  Each promotion is a conditional write on the status and version read
  by the sweep, so overlapping sweeps promote a campaign exactly once.
  Losing that race is counted, never thrown.
*/
class CampaignScheduler {
 public:
  CampaignScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<delivery::DeliveryQueue> queue, std::size_t sweep_batch);

  SweepReport Sweep(util::TimePoint now);

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<delivery::DeliveryQueue> queue_;
  std::size_t                              sweep_batch_;
};

} // namespace alo::scheduler
