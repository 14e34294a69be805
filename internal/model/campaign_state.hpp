#pragma once

#include <string_view>

#include "alo/campaign/v1/types.pb.h"

namespace alo::model {

using alo::campaign::v1::CampaignStatus;

constexpr bool IsTerminal(CampaignStatus status) {
  return status == alo::campaign::v1::CAMPAIGN_STATUS_COMPLETED || status == alo::campaign::v1::CAMPAIGN_STATUS_FAILED;
}

// Content and filters may only change while the campaign is not yet published.
constexpr bool IsEditable(CampaignStatus status) {
  return status == alo::campaign::v1::CAMPAIGN_STATUS_DRAFT || status == alo::campaign::v1::CAMPAIGN_STATUS_CANCELLED;
}

constexpr bool IsCancellable(CampaignStatus status) {
  return status == alo::campaign::v1::CAMPAIGN_STATUS_DRAFT || status == alo::campaign::v1::CAMPAIGN_STATUS_SCHEDULED;
}

/*
  Forward-only lifecycle:

    draft -> scheduled -> queued -> sending -> completed | failed
    draft -> queued

  draft/scheduled <-> cancelled is the only way back.
  sending -> sending covers claim renewal and takeover of an expired claim.
*/
constexpr bool CanTransition(CampaignStatus from, CampaignStatus to) {
  using namespace alo::campaign::v1;

  if (IsTerminal(from) || to == CAMPAIGN_STATUS_UNSPECIFIED) {
    return false;
  }

  switch (from) {
    case CAMPAIGN_STATUS_DRAFT:
      return to == CAMPAIGN_STATUS_DRAFT || to == CAMPAIGN_STATUS_SCHEDULED || to == CAMPAIGN_STATUS_QUEUED || to == CAMPAIGN_STATUS_CANCELLED;
    case CAMPAIGN_STATUS_SCHEDULED:
      return to == CAMPAIGN_STATUS_QUEUED || to == CAMPAIGN_STATUS_CANCELLED;
    case CAMPAIGN_STATUS_CANCELLED:
      return to == CAMPAIGN_STATUS_DRAFT || to == CAMPAIGN_STATUS_SCHEDULED || to == CAMPAIGN_STATUS_QUEUED;
    case CAMPAIGN_STATUS_QUEUED:
      return to == CAMPAIGN_STATUS_SENDING;
    case CAMPAIGN_STATUS_SENDING:
      return to == CAMPAIGN_STATUS_SENDING || to == CAMPAIGN_STATUS_COMPLETED || to == CAMPAIGN_STATUS_FAILED;
    default:
      return false;
  }
}

constexpr std::string_view StatusName(CampaignStatus status) {
  using namespace alo::campaign::v1;

  switch (status) {
    case CAMPAIGN_STATUS_DRAFT:
      return "draft";
    case CAMPAIGN_STATUS_SCHEDULED:
      return "scheduled";
    case CAMPAIGN_STATUS_QUEUED:
      return "queued";
    case CAMPAIGN_STATUS_SENDING:
      return "sending";
    case CAMPAIGN_STATUS_COMPLETED:
      return "completed";
    case CAMPAIGN_STATUS_FAILED:
      return "failed";
    case CAMPAIGN_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

} // namespace alo::model
