#include "segment_service.hpp"

#include <vector>

#include "internal/audience/audience_resolver.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace alo::service {

using namespace alo::campaign::v1;

SegmentService::SegmentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListSegmentsResponse SegmentService::ListSegments(const ListSegmentsRequest&) {
  return ObserveRpc("SegmentService.ListSegments", {}, [&] {
    ListSegmentsResponse resp;
    for (auto& dimension : ctx_.catalog->ListDimensions()) {
      *resp.add_segments() = std::move(dimension);
    }
    return resp;
  });
}

ListSegmentValuesResponse SegmentService::ListSegmentValues(const ListSegmentValuesRequest& req) {
  return ObserveRpc("SegmentService.ListSegmentValues", {}, [&] {
    if (req.dimension_id().empty()) {
      throw util::InvalidArgument("dimension_id is required");
    }

    ListSegmentValuesResponse resp;
    resp.set_dimension_id(req.dimension_id());
    for (auto& value : ctx_.catalog->ListValues(req.dimension_id())) {
      resp.add_values(std::move(value));
    }
    return resp;
  });
}

CountAudienceResponse SegmentService::CountAudience(const CountAudienceRequest& req) {
  return ObserveRpc("SegmentService.CountAudience", {}, [&] {
    std::vector<SegmentFilter> filters(req.filters().begin(), req.filters().end());
    filters = segment::NormalizeFilters(filters, ctx_.duplicate_policy);

    CountAudienceResponse resp;
    resp.set_count(ctx_.resolver->Count(filters));
    return resp;
  });
}

} // namespace alo::service
