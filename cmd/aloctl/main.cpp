#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "alo/campaign/v1.hpp"
#include "alo/campaign/v1/admin_service.grpc.pb.h"
#include "alo/campaign/v1/campaign_service.grpc.pb.h"
#include "alo/campaign/v1/segment_service.grpc.pb.h"

using namespace alo::campaign::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  aloctl <addr> segments\n"
            << "  aloctl <addr> values <dimension>\n"
            << "  aloctl <addr> count [type=v1,v2 ...]\n"
            << "  aloctl <addr> save <campaign.json>\n"
            << "  aloctl <addr> publish <id>\n"
            << "  aloctl <addr> cancel <id>\n"
            << "  aloctl <addr> get <id>\n"
            << "  aloctl <addr> list [draft|scheduled|queued|sending|completed|failed|cancelled]\n"
            << "  aloctl <addr> queue\n"
            << "  aloctl <addr> cleanup <days>\n"
            << "  aloctl <addr> stats\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                             out;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return "<unprintable>";
  }
  return out;
}

// "country=BR,PT" -> {type: country, values: [BR, PT]}
static bool ParseFilter(const std::string& arg, SegmentFilter* filter) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) return false;

  filter->set_type(arg.substr(0, eq));
  std::stringstream values(arg.substr(eq + 1));
  std::string       value;
  while (std::getline(values, value, ',')) {
    if (!value.empty()) filter->add_values(value);
  }
  return true;
}

static bool ParseStatus(const std::string& name, CampaignStatus* status) {
  std::string upper = "CAMPAIGN_STATUS_";
  for (char c : name) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  return CampaignStatus_Parse(upper, status);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto segment_stub  = SegmentService::NewStub(channel);
  auto campaign_stub = CampaignService::NewStub(channel);
  auto admin_stub    = CampaignAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "segments") {
    ListSegmentsResponse resp;
    auto                 status = segment_stub->ListSegments(&ctx, ListSegmentsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& dimension : resp.segments()) {
      std::cout << dimension.id() << "\t" << dimension.display_name() << "\t" << DimensionKind_Name(dimension.kind()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "values") {
    if (argc < 4) return 1;

    ListSegmentValuesRequest req;
    req.set_dimension_id(argv[3]);

    ListSegmentValuesResponse resp;
    auto                      status = segment_stub->ListSegmentValues(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& value : resp.values()) std::cout << value << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "count") {
    CountAudienceRequest req;
    for (int i = 3; i < argc; ++i) {
      if (!ParseFilter(argv[i], req.add_filters())) {
        std::cerr << "invalid filter: " << argv[i] << " (expected type=v1,v2)\n";
        return 1;
      }
    }

    CountAudienceResponse resp;
    auto                  status = segment_stub->CountAudience(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "count=" << resp.count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "save") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    SaveCampaignRequest req;
    auto                parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), req.mutable_campaign());
    if (!parsed.ok()) {
      std::cerr << "invalid campaign json: " << parsed.ToString() << "\n";
      return 1;
    }

    SaveCampaignResponse resp;
    auto                 status = campaign_stub->SaveCampaign(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp.campaign()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "publish" || cmd == "cancel" || cmd == "get") {
    if (argc < 4) return 1;

    Campaign    campaign;
    grpc::Status status;
    if (cmd == "publish") {
      PublishCampaignRequest req;
      req.set_id(argv[3]);
      PublishCampaignResponse resp;
      status   = campaign_stub->PublishCampaign(&ctx, req, &resp);
      campaign = resp.campaign();
    } else if (cmd == "cancel") {
      CancelCampaignRequest req;
      req.set_id(argv[3]);
      CancelCampaignResponse resp;
      status   = campaign_stub->CancelCampaign(&ctx, req, &resp);
      campaign = resp.campaign();
    } else {
      GetCampaignRequest req;
      req.set_id(argv[3]);
      GetCampaignResponse resp;
      status   = campaign_stub->GetCampaign(&ctx, req, &resp);
      campaign = resp.campaign();
    }
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(campaign) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListCampaignsRequest req;
    if (argc >= 4) {
      CampaignStatus filter;
      if (!ParseStatus(argv[3], &filter)) {
        std::cerr << "unknown status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(filter);
    }

    ListCampaignsResponse resp;
    auto                  status = campaign_stub->ListCampaigns(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& campaign : resp.campaigns()) {
      std::cout << campaign.id() << "\t" << CampaignStatus_Name(campaign.status()) << "\t" << campaign.name() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "queue") {
    QueueDueCampaignsResponse resp;
    auto                      status = admin_stub->QueueDueCampaigns(&ctx, QueueDueCampaignsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "promoted=" << resp.promoted() << " race_lost=" << resp.race_lost() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    if (argc < 4) return 1;

    CleanupDraftsRequest req;
    req.set_retention_days(static_cast<uint32_t>(std::stoul(argv[3])));

    CleanupDraftsResponse resp;
    auto                  status = admin_stub->CleanupDrafts(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted=" << resp.deleted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = admin_stub->Stats(&ctx, StatsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
