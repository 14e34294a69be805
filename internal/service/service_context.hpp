#pragma once

#include <cstdint>
#include <memory>

#include "internal/segment/segment_catalog.hpp"

namespace alo::audience {
class AudienceResolver;
}
namespace alo::campaign {
class CampaignManager;
}
namespace alo::cleanup {
class DraftCleanup;
}
namespace alo::scheduler {
class CampaignScheduler;
}
namespace alo::db {
class Repository;
}

namespace alo::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<alo::db::Repository>                repository;
  std::shared_ptr<alo::segment::SegmentCatalog>       catalog;
  std::shared_ptr<alo::audience::AudienceResolver>    resolver;
  std::shared_ptr<alo::campaign::CampaignManager>     manager;
  std::shared_ptr<alo::scheduler::CampaignScheduler>  scheduler;
  std::shared_ptr<alo::cleanup::DraftCleanup>         cleanup;

  alo::segment::DuplicateTypePolicy duplicate_policy       = alo::segment::DuplicateTypePolicy::kReject;
  uint32_t                          draft_retention_days   = 31;
};

} // namespace alo::service
