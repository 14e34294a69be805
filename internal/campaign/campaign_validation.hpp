#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/campaign_record.hpp"
#include "internal/segment/segment_catalog.hpp"

namespace alo::campaign {

inline constexpr std::size_t kMaxTitleChars = 65;
inline constexpr std::size_t kMaxBodyChars  = 180;

// Number of UTF-8 code points; invalid sequences count byte by byte.
std::size_t Utf8Length(std::string_view text);

/*
  Push payload problems, one message per violated rule; empty when the
  content can be sent.

    title: required, at most 65 characters
    body:  required, at most 180 characters
    url:   optional, http or https
    image, icon, badge: optional, https only
*/
std::vector<std::string> ValidateContent(const db::model::CampaignRecord& record);

/*
  Throws InvalidArgument on invalid content or duplicate filter types
  (per policy), UnknownDimension on an unregistered type. Returns the
  normalized filter list.
*/
std::vector<alo::campaign::v1::SegmentFilter> ValidateCampaign(const db::model::CampaignRecord& record, const segment::SegmentCatalog& catalog,
                                                               segment::DuplicateTypePolicy policy);

} // namespace alo::campaign
