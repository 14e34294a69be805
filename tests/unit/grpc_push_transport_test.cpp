#include <cassert>
#include <chrono>
#include <iostream>

#include <grpcpp/grpcpp.h>

#include "internal/push/grpc_push_transport.hpp"

namespace {

using alo::push::DispatchStatus;
using alo::push::GrpcPushTransport;
using namespace alo::push::v1;

SendResponse Response(SendOutcome outcome, uint32_t retry_after_ms = 0) {
  SendResponse r;
  r.set_outcome(outcome);
  r.set_retry_after_ms(retry_after_ms);
  return r;
}

void TestGatewayOutcomes() {
  assert(GrpcPushTransport::FromResponse(Response(SEND_OUTCOME_DELIVERED)).status == DispatchStatus::kSent);
  assert(GrpcPushTransport::FromResponse(Response(SEND_OUTCOME_GONE)).status == DispatchStatus::kGone);
  assert(GrpcPushTransport::FromResponse(Response(SEND_OUTCOME_REJECTED)).status == DispatchStatus::kRejected);
  assert(GrpcPushTransport::FromResponse(Response(SEND_OUTCOME_TEMPORARY_FAILURE)).status == DispatchStatus::kTransient);

  const auto limited = GrpcPushTransport::FromResponse(Response(SEND_OUTCOME_RATE_LIMITED, 2500));
  assert(limited.status == DispatchStatus::kTransient);
  assert(limited.retry_after_ms == 2500);

  const auto empty = GrpcPushTransport::FromResponse(SendResponse{});
  assert(empty.status == DispatchStatus::kTransient);
  assert(!empty.detail.empty());
}

void TestRpcFailuresAreTransient() {
  for (auto code : {::grpc::StatusCode::UNAVAILABLE, ::grpc::StatusCode::DEADLINE_EXCEEDED, ::grpc::StatusCode::RESOURCE_EXHAUSTED,
                    ::grpc::StatusCode::INTERNAL}) {
    const auto result = GrpcPushTransport::FromStatus(::grpc::Status(code, "x"));
    assert(result.status == DispatchStatus::kTransient);
    assert(!result.detail.empty());
  }
}

void TestUnreachableGatewayIsTransient() {
  alo::push::GrpcPushOptions options;
  options.target  = "127.0.0.1:1";
  options.timeout = std::chrono::milliseconds(200);
  GrpcPushTransport transport(options);

  alo::db::model::SubscriberRecord subscriber;
  subscriber.id       = "s1";
  subscriber.endpoint = "https://push.example/s1";
  PushMessage message;
  message.set_title("t");

  assert(transport.Send(subscriber, message).status == DispatchStatus::kTransient);
}

} // namespace

int main() {
  TestGatewayOutcomes();
  TestRpcFailuresAreTransient();
  TestUnreachableGatewayIsTransient();

  std::cout << "alo_unit_grpc_push_transport: pass\n";
  return 0;
}
