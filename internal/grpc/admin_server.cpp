#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace alo::grpc {

using namespace alo::campaign::v1;

AdminServer::AdminServer(std::shared_ptr<alo::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::QueueDueCampaigns(::grpc::ServerContext*, const QueueDueCampaignsRequest* req, QueueDueCampaignsResponse* resp) {
  return Invoke([&] { *resp = service_->QueueDueCampaigns(*req); });
}

::grpc::Status AdminServer::CleanupDrafts(::grpc::ServerContext*, const CleanupDraftsRequest* req, CleanupDraftsResponse* resp) {
  return Invoke([&] { *resp = service_->CleanupDrafts(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Invoke([&] { *resp = service_->Stats(*req); });
}

} // namespace alo::grpc
