#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "alo/campaign/v1/campaign_service.grpc.pb.h"
#include "internal/service/campaign_service.hpp"

namespace alo::grpc {

class CampaignServer final : public alo::campaign::v1::CampaignService::Service {
 public:
  explicit CampaignServer(std::shared_ptr<alo::service::CampaignService> svc);

  ::grpc::Status SaveCampaign(::grpc::ServerContext*, const alo::campaign::v1::SaveCampaignRequest*,
                              alo::campaign::v1::SaveCampaignResponse*) override;

  ::grpc::Status PublishCampaign(::grpc::ServerContext*, const alo::campaign::v1::PublishCampaignRequest*,
                                 alo::campaign::v1::PublishCampaignResponse*) override;

  ::grpc::Status CancelCampaign(::grpc::ServerContext*, const alo::campaign::v1::CancelCampaignRequest*,
                                alo::campaign::v1::CancelCampaignResponse*) override;

  ::grpc::Status GetCampaign(::grpc::ServerContext*, const alo::campaign::v1::GetCampaignRequest*,
                             alo::campaign::v1::GetCampaignResponse*) override;

  ::grpc::Status ListCampaigns(::grpc::ServerContext*, const alo::campaign::v1::ListCampaignsRequest*,
                               alo::campaign::v1::ListCampaignsResponse*) override;

 private:
  std::shared_ptr<alo::service::CampaignService> service_;
};

} // namespace alo::grpc
