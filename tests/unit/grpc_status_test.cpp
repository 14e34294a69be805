#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "alo/campaign/v1.hpp"
#include "internal/audience/audience_resolver.hpp"
#include "internal/campaign/campaign_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/delivery/delivery_queue.hpp"
#include "internal/grpc/campaign_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/segment_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace alo::campaign::v1;

alo::service::ServiceContext BuildServiceContext() {
  alo::service::ServiceContext ctx;
  auto repository = std::make_shared<alo::db::memory::MemoryRepository>();
  auto catalog    = std::make_shared<alo::segment::SegmentCatalog>(repository, std::chrono::milliseconds(1000));
  ctx.repository  = repository;
  ctx.catalog     = catalog;
  ctx.resolver    = std::make_shared<alo::audience::AudienceResolver>(repository, catalog);
  ctx.manager     = std::make_shared<alo::campaign::CampaignManager>(repository, catalog, std::make_shared<alo::delivery::DeliveryQueue>(),
                                                                     alo::segment::DuplicateTypePolicy::kReject);
  return ctx;
}

void TestErrorMapping() {
  using alo::grpc::ToStatus;

  assert(ToStatus(alo::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(alo::util::UnknownDimension("zodiac")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(alo::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(alo::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(alo::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(alo::util::Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(alo::util::UnknownDimension("zodiac"));
  assert(status.error_message().find("zodiac") != std::string::npos);
}

void TestCampaignServerStatuses() {
  auto ctx = BuildServiceContext();
  alo::grpc::CampaignServer server(std::make_shared<alo::service::CampaignService>(ctx));
  ::grpc::ServerContext     grpc_ctx;

  {
    GetCampaignRequest  req;
    GetCampaignResponse resp;
    assert(server.GetCampaign(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
    req.set_id("missing");
    assert(server.GetCampaign(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  SaveCampaignRequest save;
  save.mutable_campaign()->mutable_content()->set_title("Hello");
  save.mutable_campaign()->mutable_content()->set_body("World");
  SaveCampaignResponse saved;
  assert(server.SaveCampaign(&grpc_ctx, &save, &saved).ok());
  assert(saved.campaign().version() == 1);

  {
    // stale version
    SaveCampaignRequest edit;
    *edit.mutable_campaign() = saved.campaign();
    SaveCampaignResponse resp;
    assert(server.SaveCampaign(&grpc_ctx, &edit, &resp).ok());
    assert(server.SaveCampaign(&grpc_ctx, &edit, &resp).error_code() == ::grpc::StatusCode::ABORTED);
  }

  {
    SaveCampaignRequest bad = save;
    bad.mutable_campaign()->mutable_content()->set_title("");
    SaveCampaignResponse resp;
    assert(server.SaveCampaign(&grpc_ctx, &bad, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  PublishCampaignRequest publish;
  publish.set_id(saved.campaign().id());
  PublishCampaignResponse published;
  assert(server.PublishCampaign(&grpc_ctx, &publish, &published).ok());
  assert(server.PublishCampaign(&grpc_ctx, &publish, &published).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestSegmentServerStatuses() {
  auto ctx = BuildServiceContext();
  alo::grpc::SegmentServer server(std::make_shared<alo::service::SegmentService>(ctx));
  ::grpc::ServerContext    grpc_ctx;

  ListSegmentValuesRequest  req;
  ListSegmentValuesResponse resp;
  req.set_dimension_id("zodiac");
  assert(server.ListSegmentValues(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_dimension_id("os");
  assert(server.ListSegmentValues(&grpc_ctx, &req, &resp).ok());
  assert(resp.values_size() > 0);

  CountAudienceRequest count_req;
  count_req.add_filters()->set_type("country");
  count_req.add_filters()->set_type("country");
  CountAudienceResponse count_resp;
  assert(server.CountAudience(&grpc_ctx, &count_req, &count_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorMapping();
  TestCampaignServerStatuses();
  TestSegmentServerStatuses();

  std::cout << "alo_unit_grpc_status: pass\n";
  return 0;
}
