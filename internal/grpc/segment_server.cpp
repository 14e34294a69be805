#include "segment_server.hpp"

#include "grpc_error.hpp"

namespace alo::grpc {

using namespace alo::campaign::v1;

SegmentServer::SegmentServer(std::shared_ptr<alo::service::SegmentService> svc) : service_(std::move(svc)) {
}

::grpc::Status SegmentServer::ListSegments(::grpc::ServerContext*, const ListSegmentsRequest* req, ListSegmentsResponse* resp) {
  return Invoke([&] { *resp = service_->ListSegments(*req); });
}

::grpc::Status SegmentServer::ListSegmentValues(::grpc::ServerContext*, const ListSegmentValuesRequest* req, ListSegmentValuesResponse* resp) {
  return Invoke([&] { *resp = service_->ListSegmentValues(*req); });
}

::grpc::Status SegmentServer::CountAudience(::grpc::ServerContext*, const CountAudienceRequest* req, CountAudienceResponse* resp) {
  return Invoke([&] { *resp = service_->CountAudience(*req); });
}

} // namespace alo::grpc
