#include "segment_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace alo::db::sql {

std::string EncodeSegments(const std::vector<alo::campaign::v1::SegmentFilter>& filters) {
  alo::campaign::v1::SegmentFilterList list;
  for (const auto& filter : filters) {
    *list.add_filters() = filter;
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode segments: " + std::string(status.message()));
  }
  return json;
}

std::vector<alo::campaign::v1::SegmentFilter> DecodeSegments(const std::string& json) {
  if (json.empty()) {
    return {};
  }

  alo::campaign::v1::SegmentFilterList list;
  auto                                 status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw std::runtime_error("decode segments: " + std::string(status.message()));
  }
  return {list.filters().begin(), list.filters().end()};
}

} // namespace alo::db::sql
