#pragma once

#include "alo/campaign/v1.hpp"
#include "service_context.hpp"

namespace alo::service {

class SegmentService {
 public:
  explicit SegmentService(ServiceContext ctx);

  alo::campaign::v1::ListSegmentsResponse ListSegments(const alo::campaign::v1::ListSegmentsRequest& req);

  alo::campaign::v1::ListSegmentValuesResponse ListSegmentValues(const alo::campaign::v1::ListSegmentValuesRequest& req);

  // Filters go through the duplicate-type policy first.
  alo::campaign::v1::CountAudienceResponse CountAudience(const alo::campaign::v1::CountAudienceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace alo::service
