#pragma once

#include <string>
#include <vector>

#include "alo/campaign/v1/types.pb.h"

namespace alo::db::sql {

// Segment filters are stored as the protobuf JSON form of SegmentFilterList.
std::string                                   EncodeSegments(const std::vector<alo::campaign::v1::SegmentFilter>& filters);
std::vector<alo::campaign::v1::SegmentFilter> DecodeSegments(const std::string& json);

} // namespace alo::db::sql
