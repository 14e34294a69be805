#pragma once

#include "alo/campaign/v1.hpp"
#include "service_context.hpp"

namespace alo::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  // Runs a scheduler sweep immediately.
  alo::campaign::v1::QueueDueCampaignsResponse QueueDueCampaigns(const alo::campaign::v1::QueueDueCampaignsRequest& req);

  alo::campaign::v1::CleanupDraftsResponse CleanupDrafts(const alo::campaign::v1::CleanupDraftsRequest& req);

  alo::campaign::v1::StatsResponse Stats(const alo::campaign::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace alo::service
