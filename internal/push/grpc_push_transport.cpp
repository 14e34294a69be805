#include "grpc_push_transport.hpp"

namespace alo::push {

using alo::push::v1::SendRequest;
using alo::push::v1::SendResponse;

GrpcPushTransport::GrpcPushTransport(GrpcPushOptions options)
    : GrpcPushTransport(::grpc::CreateChannel(options.target, ::grpc::InsecureChannelCredentials()), options) {
}

GrpcPushTransport::GrpcPushTransport(std::shared_ptr<::grpc::Channel> channel, GrpcPushOptions options)
    : options_(std::move(options)), stub_(alo::push::v1::PushGateway::NewStub(std::move(channel))) {
}

DispatchResult GrpcPushTransport::Send(const db::model::SubscriberRecord& subscriber, const alo::push::v1::PushMessage& message) {
  SendRequest req;
  auto*       endpoint = req.mutable_endpoint();
  endpoint->set_subscriber_id(subscriber.id);
  endpoint->set_endpoint(subscriber.endpoint);
  endpoint->set_credentials(subscriber.credentials);
  *req.mutable_message() = message;
  req.set_ttl_seconds(options_.ttl_seconds);

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + options_.timeout);

  SendResponse resp;
  auto         status = stub_->Send(&ctx, req, &resp);
  if (!status.ok()) {
    return FromStatus(status);
  }
  return FromResponse(resp);
}

DispatchResult GrpcPushTransport::FromResponse(const SendResponse& response) {
  DispatchResult result;
  result.detail         = response.detail();
  result.retry_after_ms = response.retry_after_ms();

  switch (response.outcome()) {
    case alo::push::v1::SEND_OUTCOME_DELIVERED:
      result.status = DispatchStatus::kSent;
      break;
    case alo::push::v1::SEND_OUTCOME_GONE:
      result.status = DispatchStatus::kGone;
      break;
    case alo::push::v1::SEND_OUTCOME_REJECTED:
      result.status = DispatchStatus::kRejected;
      break;
    case alo::push::v1::SEND_OUTCOME_RATE_LIMITED:
    case alo::push::v1::SEND_OUTCOME_TEMPORARY_FAILURE:
      result.status = DispatchStatus::kTransient;
      break;
    default:
      result.status = DispatchStatus::kTransient;
      if (result.detail.empty()) result.detail = "gateway returned no outcome";
      break;
  }
  return result;
}

DispatchResult GrpcPushTransport::FromStatus(const ::grpc::Status& status) {
  // every RPC failure is retryable; the recipient itself was never judged
  DispatchResult result;
  result.status = DispatchStatus::kTransient;

  switch (status.error_code()) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      result.detail = "gateway deadline exceeded";
      break;
    case ::grpc::StatusCode::UNAVAILABLE:
      result.detail = "gateway unavailable: " + status.error_message();
      break;
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      result.detail = "gateway throttled: " + status.error_message();
      break;
    default:
      result.detail = "gateway error " + std::to_string(static_cast<int>(status.error_code())) + ": " + status.error_message();
      break;
  }
  return result;
}

} // namespace alo::push
