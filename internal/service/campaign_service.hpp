#pragma once

#include "alo/campaign/v1.hpp"
#include "service_context.hpp"

namespace alo::service {

class CampaignService {
 public:
  explicit CampaignService(ServiceContext ctx);

  alo::campaign::v1::SaveCampaignResponse SaveCampaign(const alo::campaign::v1::SaveCampaignRequest& req);

  alo::campaign::v1::PublishCampaignResponse PublishCampaign(const alo::campaign::v1::PublishCampaignRequest& req);

  alo::campaign::v1::CancelCampaignResponse CancelCampaign(const alo::campaign::v1::CancelCampaignRequest& req);

  alo::campaign::v1::GetCampaignResponse GetCampaign(const alo::campaign::v1::GetCampaignRequest& req);

  alo::campaign::v1::ListCampaignsResponse ListCampaigns(const alo::campaign::v1::ListCampaignsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace alo::service
