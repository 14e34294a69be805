#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>

#include "alo/push/v1/push_gateway.grpc.pb.h"
#include "push_transport.hpp"

namespace alo::push {

struct GrpcPushOptions {
  std::string               target;
  std::chrono::milliseconds timeout{10000};
  uint32_t                  ttl_seconds = 86400;
};

/*
  PushTransport over the alo.push.v1.PushGateway service.

  One channel shared by all callers; each Send carries its own deadline.
*/
class GrpcPushTransport final : public PushTransport {
 public:
  explicit GrpcPushTransport(GrpcPushOptions options);
  GrpcPushTransport(std::shared_ptr<::grpc::Channel> channel, GrpcPushOptions options);

  DispatchResult Send(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) override;

  // Gateway outcome / RPC status to dispatch result.
  static DispatchResult FromResponse(const alo::push::v1::SendResponse& response);
  static DispatchResult FromStatus(const ::grpc::Status& status);

 private:
  GrpcPushOptions                                 options_;
  std::unique_ptr<alo::push::v1::PushGateway::Stub> stub_;
};

} // namespace alo::push
