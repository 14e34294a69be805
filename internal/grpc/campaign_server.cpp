#include "campaign_server.hpp"

#include "grpc_error.hpp"

namespace alo::grpc {

using namespace alo::campaign::v1;

CampaignServer::CampaignServer(std::shared_ptr<alo::service::CampaignService> svc) : service_(std::move(svc)) {
}

::grpc::Status CampaignServer::SaveCampaign(::grpc::ServerContext*, const SaveCampaignRequest* req, SaveCampaignResponse* resp) {
  return Invoke([&] { *resp = service_->SaveCampaign(*req); });
}

::grpc::Status CampaignServer::PublishCampaign(::grpc::ServerContext*, const PublishCampaignRequest* req, PublishCampaignResponse* resp) {
  return Invoke([&] { *resp = service_->PublishCampaign(*req); });
}

::grpc::Status CampaignServer::CancelCampaign(::grpc::ServerContext*, const CancelCampaignRequest* req, CancelCampaignResponse* resp) {
  return Invoke([&] { *resp = service_->CancelCampaign(*req); });
}

::grpc::Status CampaignServer::GetCampaign(::grpc::ServerContext*, const GetCampaignRequest* req, GetCampaignResponse* resp) {
  return Invoke([&] { *resp = service_->GetCampaign(*req); });
}

::grpc::Status CampaignServer::ListCampaigns(::grpc::ServerContext*, const ListCampaignsRequest* req, ListCampaignsResponse* resp) {
  return Invoke([&] { *resp = service_->ListCampaigns(*req); });
}

} // namespace alo::grpc
