#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "alo/campaign/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/util/time.hpp"

namespace alo::delivery {
class DeliveryQueue;
}

namespace alo::campaign {

struct CampaignStats {
  std::map<alo::campaign::v1::CampaignStatus, uint64_t> by_status;
  uint64_t                                              active_subscribers = 0;

  uint64_t Count(alo::campaign::v1::CampaignStatus status) const {
    auto it = by_status.find(status);
    return it == by_status.end() ? 0 : it->second;
  }
};

/*
  Campaign lifecycle on the authoring side.

  Every change is a conditional write on the stored (status, version);
  the delivery side never goes through this class.
*/
class CampaignManager {
 public:
  static constexpr std::size_t kDefaultListLimit = 100;
  static constexpr std::size_t kMaxListLimit     = 1000;

  CampaignManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<segment::SegmentCatalog> catalog,
                  std::shared_ptr<delivery::DeliveryQueue> queue, segment::DuplicateTypePolicy duplicate_policy, util::NowFn now = util::Now);

  // Creates a draft when id is empty, otherwise edits a draft or
  // cancelled campaign (which reopens as draft). A non-zero version must
  // match the stored one.
  alo::campaign::v1::Campaign Save(const alo::campaign::v1::Campaign& campaign);

  // draft|cancelled -> scheduled (send_at set) or queued (send now).
  alo::campaign::v1::Campaign Publish(const std::string& id);

  // draft|scheduled -> cancelled.
  alo::campaign::v1::Campaign Cancel(const std::string& id);

  alo::campaign::v1::Campaign Get(const std::string& id);

  // Newest first; UNSPECIFIED lists every status.
  std::vector<alo::campaign::v1::Campaign> List(alo::campaign::v1::CampaignStatus status, std::size_t limit);

  CampaignStats Stats();

 private:
  db::model::CampaignRecord Load(db::Transaction& tx, const std::string& id);
  void Store(db::Transaction& tx, const db::model::CampaignRecord& updated, const db::model::CampaignRecord& previous);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<segment::SegmentCatalog> catalog_;
  std::shared_ptr<delivery::DeliveryQueue> queue_;
  segment::DuplicateTypePolicy             duplicate_policy_;
  util::NowFn                              now_;
};

} // namespace alo::campaign
