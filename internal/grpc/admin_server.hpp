#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "alo/campaign/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace alo::grpc {

class AdminServer final : public alo::campaign::v1::CampaignAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<alo::service::AdminService> svc);

  ::grpc::Status QueueDueCampaigns(::grpc::ServerContext*, const alo::campaign::v1::QueueDueCampaignsRequest*,
                                   alo::campaign::v1::QueueDueCampaignsResponse*) override;

  ::grpc::Status CleanupDrafts(::grpc::ServerContext*, const alo::campaign::v1::CleanupDraftsRequest*,
                               alo::campaign::v1::CleanupDraftsResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const alo::campaign::v1::StatsRequest*, alo::campaign::v1::StatsResponse*) override;

 private:
  std::shared_ptr<alo::service::AdminService> service_;
};

} // namespace alo::grpc
