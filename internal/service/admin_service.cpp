#include "admin_service.hpp"

#include "internal/campaign/campaign_manager.hpp"
#include "internal/cleanup/draft_cleanup.hpp"
#include "internal/scheduler/campaign_scheduler.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace alo::service {

using namespace alo::campaign::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

QueueDueCampaignsResponse AdminService::QueueDueCampaigns(const QueueDueCampaignsRequest&) {
  return ObserveRpc("CampaignAdminService.QueueDueCampaigns", {}, [&] {
    const auto report = ctx_.scheduler->Sweep(util::Now());

    QueueDueCampaignsResponse resp;
    resp.set_promoted(report.promoted);
    resp.set_race_lost(report.race_lost);
    return resp;
  });
}

CleanupDraftsResponse AdminService::CleanupDrafts(const CleanupDraftsRequest& req) {
  return ObserveRpc("CampaignAdminService.CleanupDrafts", {}, [&] {
    const uint32_t days = req.retention_days() == 0 ? ctx_.draft_retention_days : req.retention_days();

    CleanupDraftsResponse resp;
    resp.set_deleted(ctx_.cleanup->CleanupDrafts(days));
    return resp;
  });
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("CampaignAdminService.Stats", {}, [&] {
    const auto stats = ctx_.manager->Stats();

    StatsResponse resp;
    resp.set_drafts(stats.Count(CAMPAIGN_STATUS_DRAFT));
    resp.set_scheduled(stats.Count(CAMPAIGN_STATUS_SCHEDULED));
    resp.set_queued(stats.Count(CAMPAIGN_STATUS_QUEUED));
    resp.set_sending(stats.Count(CAMPAIGN_STATUS_SENDING));
    resp.set_completed(stats.Count(CAMPAIGN_STATUS_COMPLETED));
    resp.set_failed(stats.Count(CAMPAIGN_STATUS_FAILED));
    resp.set_cancelled(stats.Count(CAMPAIGN_STATUS_CANCELLED));
    resp.set_active_subscribers(stats.active_subscribers);
    return resp;
  });
}

} // namespace alo::service
