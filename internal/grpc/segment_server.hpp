#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "alo/campaign/v1/segment_service.grpc.pb.h"
#include "internal/service/segment_service.hpp"

namespace alo::grpc {

class SegmentServer final : public alo::campaign::v1::SegmentService::Service {
 public:
  explicit SegmentServer(std::shared_ptr<alo::service::SegmentService> svc);

  ::grpc::Status ListSegments(::grpc::ServerContext*, const alo::campaign::v1::ListSegmentsRequest*,
                              alo::campaign::v1::ListSegmentsResponse*) override;

  ::grpc::Status ListSegmentValues(::grpc::ServerContext*, const alo::campaign::v1::ListSegmentValuesRequest*,
                                   alo::campaign::v1::ListSegmentValuesResponse*) override;

  ::grpc::Status CountAudience(::grpc::ServerContext*, const alo::campaign::v1::CountAudienceRequest*,
                               alo::campaign::v1::CountAudienceResponse*) override;

 private:
  std::shared_ptr<alo::service::SegmentService> service_;
};

} // namespace alo::grpc
