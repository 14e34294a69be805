#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "alo/campaign/v1/types.pb.h"

namespace alo::db::model {

/*
  Persistent campaign row.

  IMPORTANT:
  - status + version are the compare-and-set key for every transition.
  - Writers bump version by exactly one per write.
  - claimed_by / claim_expires_at_ms fence the single active sender.
*/

struct CampaignRecord {
  std::string id;
  std::string name;

  // push content
  std::string title;
  std::string body;
  std::string url;
  std::string image;
  std::string icon;
  std::string badge;
  bool        require_interaction = false;
  bool        renotify            = false;
  bool        silent              = false;

  std::vector<alo::campaign::v1::SegmentFilter> segments;

  // 0 = send on publish
  uint64_t send_at_ms = 0;

  alo::campaign::v1::CampaignStatus status = alo::campaign::v1::CAMPAIGN_STATUS_UNSPECIFIED;
  uint64_t                          version = 0;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t queued_at_ms    = 0;
  uint64_t started_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  uint64_t audience_count = 0;
  uint64_t sent_count     = 0;
  uint64_t failed_count   = 0;

  std::string failure_reason;

  std::string claimed_by;
  uint64_t    claim_expires_at_ms = 0;
};

} // namespace alo::db::model
