#include "campaign_service.hpp"

#include "internal/campaign/campaign_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace alo::service {

using namespace alo::campaign::v1;

namespace {

void RequireId(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidArgument("campaign id is required");
  }
}

} // namespace

CampaignService::CampaignService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SaveCampaignResponse CampaignService::SaveCampaign(const SaveCampaignRequest& req) {
  return ObserveRpc("CampaignService.SaveCampaign", req.campaign().id(), [&] {
    if (!req.has_campaign()) {
      throw util::InvalidArgument("campaign is required");
    }
    SaveCampaignResponse resp;
    *resp.mutable_campaign() = ctx_.manager->Save(req.campaign());
    return resp;
  });
}

PublishCampaignResponse CampaignService::PublishCampaign(const PublishCampaignRequest& req) {
  return ObserveRpc("CampaignService.PublishCampaign", req.id(), [&] {
    RequireId(req.id());
    PublishCampaignResponse resp;
    *resp.mutable_campaign() = ctx_.manager->Publish(req.id());
    return resp;
  });
}

CancelCampaignResponse CampaignService::CancelCampaign(const CancelCampaignRequest& req) {
  return ObserveRpc("CampaignService.CancelCampaign", req.id(), [&] {
    RequireId(req.id());
    CancelCampaignResponse resp;
    *resp.mutable_campaign() = ctx_.manager->Cancel(req.id());
    return resp;
  });
}

GetCampaignResponse CampaignService::GetCampaign(const GetCampaignRequest& req) {
  return ObserveRpc("CampaignService.GetCampaign", req.id(), [&] {
    RequireId(req.id());
    GetCampaignResponse resp;
    *resp.mutable_campaign() = ctx_.manager->Get(req.id());
    return resp;
  });
}

ListCampaignsResponse CampaignService::ListCampaigns(const ListCampaignsRequest& req) {
  return ObserveRpc("CampaignService.ListCampaigns", {}, [&] {
    ListCampaignsResponse resp;
    for (auto& campaign : ctx_.manager->List(req.status(), req.limit())) {
      *resp.add_campaigns() = std::move(campaign);
    }
    return resp;
  });
}

} // namespace alo::service
